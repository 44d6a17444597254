#include "inference/whisper_server_backend.hpp"
#include "util/http_client.hpp"
#include "util/log.hpp"
#include "util/strings.hpp"
#include "wav.hpp"

#include <chrono>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string base_url(uint16_t port) {
    return std::format("http://127.0.0.1:{}", port);
}

} // namespace

std::vector<BinaryCandidate> WhisperServerBackend::binaries(bool prefer_gpu) const {
    std::vector<BinaryCandidate> out;
    if (prefer_gpu) out.push_back({.name = "whisper-server-cuda", .gpu = true});
    out.push_back({.name = "whisper-server", .gpu = false});
    return out;
}

Result<std::vector<std::string>> WhisperServerBackend::build_args(const std::string& model_path,
                                                                 uint16_t port,
                                                                 const LaunchOptions& options) const {
    std::vector<std::string> args = {
        "--model", model_path,
        "--host", "127.0.0.1",
        "--port", std::to_string(port),
    };
    if (options.threads > 0) {
        args.push_back("--threads");
        args.push_back(std::to_string(options.threads));
    }
    args.push_back("--language");
    args.push_back(options.language.empty() ? "auto" : options.language);
    return args;
}

bool WhisperServerBackend::ping(uint16_t port) {
    // Any HTTP answer means the server is accepting requests.
    return http::get(base_url(port) + "/", timeouts_.health).has_value();
}

bool WhisperServerBackend::check_ready(const ChildProcess&, uint16_t port) {
    return ping(port);
}

bool WhisperServerBackend::healthy(uint16_t port, bool process_alive) {
    return process_alive && ping(port);
}

Result<TranscriptResult> WhisperServerBackend::transcribe(uint16_t port,
                                                          std::span<const int16_t> samples,
                                                          uint32_t sample_rate,
                                                          const TranscribeOptions& options) {
    if (samples.empty()) {
        return make_error(ErrorCode::InvalidArgument, "empty audio");
    }

    double duration_s = static_cast<double>(samples.size()) / sample_rate;
    auto wav_data = wav::encode(samples, sample_rate);

    std::vector<http::MultipartField> fields = {
        {.name = "file",
         .data = std::string(reinterpret_cast<const char*>(wav_data.data()), wav_data.size()),
         .filename = "audio.wav",
         .content_type = "audio/wav"},
        {.name = "temperature", .data = "0.0"},
        {.name = "response_format", .data = "json"},
    };
    fields.push_back({.name = "language", .data = options.language.empty() ? "auto" : options.language});
    if (!options.prompt.empty()) {
        fields.push_back({.name = "prompt", .data = options.prompt});
    }

    auto start = std::chrono::steady_clock::now();
    auto resp = http::post_multipart(base_url(port) + "/inference", fields, timeouts_.request);
    double processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!resp) return std::unexpected(resp.error());
    if (resp->status != 200) {
        return make_error(ErrorCode::HttpStatus,
                          std::format("whisper-server returned HTTP {}: {}", resp->status,
                                      resp->body.substr(0, 200)),
                          resp->status);
    }

    try {
        auto j = json::parse(resp->body);
        if (j.contains("error")) {
            return make_error(ErrorCode::Protocol, "whisper-server error: " + j["error"].dump());
        }
        if (!j.contains("text")) {
            return make_error(ErrorCode::Protocol, "unexpected response: " + resp->body.substr(0, 200));
        }
        auto text = trim(j["text"].get<std::string>());
        logging::debug("whisper-server: {:.2f}s of audio in {:.2f}s", duration_s, processing_s);
        return TranscriptResult{
            .text = std::move(text),
            .duration_s = duration_s,
            .processing_s = processing_s,
        };
    } catch (const json::exception& e) {
        return make_error(ErrorCode::Protocol, std::string("JSON parse error: ") + e.what());
    }
}
