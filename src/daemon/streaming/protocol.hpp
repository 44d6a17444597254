#pragma once

#include "util/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

inline constexpr uint32_t kDefaultStreamingSampleRate = 16000;

// Per-dictation connection parameters. A warm socket is only adoptable by a
// connect() whose options compare equal.
struct StreamingOptions {
    std::string language = "auto";
    uint32_t sample_rate = kDefaultStreamingSampleRate;
    std::vector<std::string> keyterms;

    bool operator==(const StreamingOptions&) const = default;
};

enum class ServerMessageType {
    Metadata,
    Results,
    SpeechStarted,
    UtteranceEnd,
    Error,
    Unknown,
};

struct ServerMessage {
    ServerMessageType type = ServerMessageType::Unknown;
    std::string type_name;
    std::string request_id;     // Metadata
    std::string transcript;     // Results: channel.alternatives[0].transcript
    bool is_final = false;
    bool from_finalize = false;
    std::string description;    // Error

    bool final_result() const { return is_final || from_finalize; }
};

// Wire format of the real-time listen endpoint.
namespace listen_protocol {

inline constexpr std::string_view kDefaultUrl = "wss://api.deepgram.com/v1/listen";

// "nova-3" for auto-detect and supported languages, otherwise "nova-2".
std::string select_model(std::string_view language);

std::string build_url(std::string_view base_url, const StreamingOptions& options);

std::string keepalive_message();
std::string finalize_message();
std::string close_stream_message();

Result<ServerMessage> parse_server_message(std::string_view text);

// Zeroed 16-bit mono PCM of the given duration.
std::vector<uint8_t> silence_frame(uint32_t sample_rate,
                                   std::chrono::milliseconds duration = std::chrono::milliseconds(100));

bool is_auth_failure(std::string_view message);

std::string url_encode(std::string_view s);

} // namespace listen_protocol
