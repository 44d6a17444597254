#pragma once

#include <optional>
#include <string_view>

enum class ServerState {
    Stopped,
    Starting,
    Ready,
    Degraded,
    Crashed,
};

enum class ServerEvent {
    StartRequested,
    BecameReady,
    StartupFailed,
    HealthFailed,
    HealthRecovered,
    ProcessExited,
    StopRequested,
};

// Next state for `event` in `state`, or nullopt when the event does not apply.
std::optional<ServerState> transition(ServerState state, ServerEvent event);

// Ready and degraded servers still take transcription requests.
bool accepts_requests(ServerState state);

std::string_view to_string(ServerState state);
std::string_view to_string(ServerEvent event);
