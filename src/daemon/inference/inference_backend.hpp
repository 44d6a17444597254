#pragma once

#include "inference/port_allocator.hpp"
#include "util/error.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

class ChildProcess;

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

struct TranscribeOptions {
    std::string language;
    std::string prompt;
};

struct LaunchOptions {
    std::string bin_dir;
    std::string language = "auto";
    int threads = 0;            // 0 = let the backend decide
    bool prefer_gpu = false;
    bool warm_up_inference = true;
};

struct BinaryCandidate {
    std::string name;
    bool gpu = false;
};

// One family of local inference servers: how to launch it, how to tell it
// is ready and healthy, and how to talk to it.
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    virtual std::string_view name() const = 0;
    virtual PortRange port_range() const = 0;
    virtual std::chrono::milliseconds startup_timeout() const = 0;

    // In launch order; GPU variants first when preferred.
    virtual std::vector<BinaryCandidate> binaries(bool prefer_gpu) const = 0;

    virtual Result<std::vector<std::string>> build_args(const std::string& model_path,
                                                        uint16_t port,
                                                        const LaunchOptions& options) const = 0;

    // Polled during startup until true or the startup timeout.
    virtual bool check_ready(const ChildProcess& process, uint16_t port) = 0;

    virtual bool healthy(uint16_t port, bool process_alive) = 0;
    virtual bool skip_health_while_busy() const { return false; }

    virtual Result<TranscriptResult> transcribe(uint16_t port,
                                                std::span<const int16_t> samples,
                                                uint32_t sample_rate,
                                                const TranscribeOptions& options) = 0;
};
