#include "streaming/protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace listen_protocol {

namespace {

constexpr std::array<std::string_view, 48> kNova3Languages = {
    "ar", "be", "bn", "bs", "bg", "ca", "hr", "cs", "da", "nl", "en", "et",
    "fi", "fr", "de", "el", "he", "hi", "hu", "id", "it", "ja", "kn", "ko",
    "lv", "lt", "mk", "ms", "mr", "no", "fa", "pl", "pt", "ro", "ru", "sr",
    "sk", "sl", "es", "sv", "tl", "ta", "te", "tr", "uk", "ur", "vi", "multi",
};

bool nova3_supports(std::string_view lang) {
    return std::ranges::find(kNova3Languages, lang) != kNova3Languages.end();
}

std::string base_language(std::string_view lang) {
    std::string base(lang.substr(0, lang.find('-')));
    std::transform(base.begin(), base.end(), base.begin(), ::tolower);
    return base;
}

bool uses_nova3(std::string_view language) {
    if (language.empty() || language == "auto") return true;
    return nova3_supports(language) || nova3_supports(base_language(language));
}

} // namespace

std::string select_model(std::string_view language) {
    return uses_nova3(language) ? "nova-3" : "nova-2";
}

std::string url_encode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    return out;
}

std::string build_url(std::string_view base_url, const StreamingOptions& options) {
    bool nova3 = uses_nova3(options.language);
    uint32_t rate = options.sample_rate ? options.sample_rate : kDefaultStreamingSampleRate;

    std::string url = std::format(
        "{}?encoding=linear16&sample_rate={}&channels=1&model={}&punctuate=true&interim_results=true",
        base_url, rate, nova3 ? "nova-3" : "nova-2");

    if (!options.language.empty() && options.language != "auto") {
        url += "&language=" + url_encode(options.language);
    }

    const char* param = nova3 ? "keyterm" : "keywords";
    for (auto& term : options.keyterms) {
        if (term.empty()) continue;
        url += std::format("&{}={}", param, url_encode(term));
    }
    return url;
}

std::string keepalive_message() { return R"({"type":"KeepAlive"})"; }
std::string finalize_message() { return R"({"type":"Finalize"})"; }
std::string close_stream_message() { return R"({"type":"CloseStream"})"; }

Result<ServerMessage> parse_server_message(std::string_view text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return make_error(ErrorCode::Protocol, "server message is not an object");
        }

        ServerMessage msg;
        msg.type_name = j.value("type", "");

        if (msg.type_name == "Metadata") {
            msg.type = ServerMessageType::Metadata;
            msg.request_id = j.value("request_id", "");
        } else if (msg.type_name == "Results") {
            msg.type = ServerMessageType::Results;
            msg.is_final = j.value("is_final", false);
            msg.from_finalize = j.value("from_finalize", false);
            if (j.contains("channel") && j["channel"].contains("alternatives")) {
                auto& alts = j["channel"]["alternatives"];
                if (alts.is_array() && !alts.empty() && alts[0].contains("transcript")) {
                    msg.transcript = alts[0]["transcript"].get<std::string>();
                }
            }
        } else if (msg.type_name == "SpeechStarted") {
            msg.type = ServerMessageType::SpeechStarted;
        } else if (msg.type_name == "UtteranceEnd") {
            msg.type = ServerMessageType::UtteranceEnd;
        } else if (msg.type_name == "Error") {
            msg.type = ServerMessageType::Error;
            msg.description = j.value("description", "");
            if (msg.description.empty()) msg.description = j.value("message", "");
        }
        return msg;
    } catch (const json::exception& e) {
        return make_error(ErrorCode::Protocol, std::string("malformed server message: ") + e.what());
    }
}

std::vector<uint8_t> silence_frame(uint32_t sample_rate, std::chrono::milliseconds duration) {
    size_t samples = static_cast<size_t>(sample_rate) * duration.count() / 1000;
    return std::vector<uint8_t>(samples * sizeof(int16_t), 0);
}

bool is_auth_failure(std::string_view message) {
    return message.find("401") != std::string_view::npos ||
           message.find("Unauthorized") != std::string_view::npos;
}

} // namespace listen_protocol
