#pragma once

#include "inference/inference_backend.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

// sherpa-onnx's offline WebSocket server running a transducer model
// (parakeet). One binary message per utterance, one JSON reply.
class SherpaWsBackend : public InferenceBackend {
public:
    static constexpr const char* kReadyMarker = "Listening on:";

    explicit SherpaWsBackend(std::chrono::milliseconds request_timeout = std::chrono::milliseconds(300000))
        : request_timeout_(request_timeout) {}

    std::string_view name() const override { return "sherpa-onnx"; }
    PortRange port_range() const override { return {6006, 6029}; }
    std::chrono::milliseconds startup_timeout() const override { return std::chrono::milliseconds(60000); }

    std::vector<BinaryCandidate> binaries(bool prefer_gpu) const override;
    Result<std::vector<std::string>> build_args(const std::string& model_path,
                                                uint16_t port,
                                                const LaunchOptions& options) const override;

    bool check_ready(const ChildProcess& process, uint16_t port) override;
    bool healthy(uint16_t port, bool process_alive) override;
    bool skip_health_while_busy() const override { return true; }

    Result<TranscriptResult> transcribe(uint16_t port,
                                        std::span<const int16_t> samples,
                                        uint32_t sample_rate,
                                        const TranscribeOptions& options) override;

private:
    std::chrono::milliseconds request_timeout_;
};

namespace sherpa_protocol {

// [int32 LE sample rate][int32 LE payload bytes][float32 LE samples]
std::vector<uint8_t> encode_request(std::span<const float> samples, uint32_t sample_rate);

// The reply is JSON with a "text" field; anything else is taken as plain text.
std::string parse_reply(const std::string& reply);

// Threads for the server when none are configured: leave headroom for the
// rest of the desktop, clamped to [2, 8].
int default_thread_count(unsigned hardware_threads);

} // namespace sherpa_protocol
