#pragma once

#include "inference/inference_backend.hpp"

#include <chrono>
#include <string>

// whisper.cpp's whisper-server: batch transcription over HTTP.
class WhisperServerBackend : public InferenceBackend {
public:
    struct Timeouts {
        std::chrono::milliseconds health{2000};
        std::chrono::milliseconds request{300000};
    };

    WhisperServerBackend() = default;
    explicit WhisperServerBackend(Timeouts timeouts) : timeouts_(timeouts) {}

    std::string_view name() const override { return "whisper-server"; }
    PortRange port_range() const override { return {8178, 8199}; }
    std::chrono::milliseconds startup_timeout() const override { return std::chrono::milliseconds(30000); }

    std::vector<BinaryCandidate> binaries(bool prefer_gpu) const override;
    Result<std::vector<std::string>> build_args(const std::string& model_path,
                                                uint16_t port,
                                                const LaunchOptions& options) const override;

    bool check_ready(const ChildProcess& process, uint16_t port) override;
    bool healthy(uint16_t port, bool process_alive) override;

    Result<TranscriptResult> transcribe(uint16_t port,
                                        std::span<const int16_t> samples,
                                        uint32_t sample_rate,
                                        const TranscribeOptions& options) override;

private:
    bool ping(uint16_t port);

    Timeouts timeouts_;
};
