#include "inference/server_state.hpp"

std::optional<ServerState> transition(ServerState state, ServerEvent event) {
    using S = ServerState;
    using E = ServerEvent;

    if (event == E::StopRequested) return S::Stopped;

    switch (state) {
        case S::Stopped:
        case S::Crashed:
            if (event == E::StartRequested) return S::Starting;
            break;
        case S::Starting:
            if (event == E::BecameReady) return S::Ready;
            if (event == E::StartupFailed) return S::Stopped;
            break;
        case S::Ready:
            if (event == E::HealthFailed) return S::Degraded;
            if (event == E::ProcessExited) return S::Crashed;
            break;
        case S::Degraded:
            if (event == E::HealthRecovered) return S::Ready;
            if (event == E::ProcessExited) return S::Crashed;
            break;
    }
    return std::nullopt;
}

bool accepts_requests(ServerState state) {
    return state == ServerState::Ready || state == ServerState::Degraded;
}

std::string_view to_string(ServerState state) {
    switch (state) {
        case ServerState::Stopped: return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Ready: return "ready";
        case ServerState::Degraded: return "degraded";
        case ServerState::Crashed: return "crashed";
    }
    return "unknown";
}

std::string_view to_string(ServerEvent event) {
    switch (event) {
        case ServerEvent::StartRequested: return "start_requested";
        case ServerEvent::BecameReady: return "became_ready";
        case ServerEvent::StartupFailed: return "startup_failed";
        case ServerEvent::HealthFailed: return "health_failed";
        case ServerEvent::HealthRecovered: return "health_recovered";
        case ServerEvent::ProcessExited: return "process_exited";
        case ServerEvent::StopRequested: return "stop_requested";
    }
    return "unknown";
}
