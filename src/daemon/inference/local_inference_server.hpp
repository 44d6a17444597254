#pragma once

#include "inference/child_process.hpp"
#include "inference/inference_backend.hpp"
#include "inference/server_state.hpp"
#include "util/error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <thread>

// Supervises one local inference server process: start (coalesced), health
// checks, GPU-to-CPU fallback, transcription requests and shutdown.
// Thread-safe; every call blocks the caller.
class LocalInferenceServer {
public:
    // Emitted events: "gpu-fallback", "ready", "crashed".
    using EventCallback = std::function<void(std::string_view event, const std::string& detail)>;

    struct Timing {
        std::chrono::milliseconds startup_poll{100};
        std::chrono::milliseconds health_interval{5000};
        // A GPU binary exiting within this window counts as a failed GPU launch.
        std::chrono::milliseconds early_exit_window{10000};
        std::chrono::milliseconds stop_grace{5000};
        std::chrono::milliseconds warm_up_audio{500};
    };

    struct Status {
        ServerState state = ServerState::Stopped;
        uint16_t port = 0;
        pid_t pid = 0;
        std::string model_path;
        std::string binary;
        bool gpu = false;
        int in_flight = 0;
    };

    explicit LocalInferenceServer(std::unique_ptr<InferenceBackend> backend);
    LocalInferenceServer(std::unique_ptr<InferenceBackend> backend, Timing timing);
    ~LocalInferenceServer();

    LocalInferenceServer(const LocalInferenceServer&) = delete;
    LocalInferenceServer& operator=(const LocalInferenceServer&) = delete;

    Result<void> start(const std::string& model_path, const LaunchOptions& options = {});
    Result<TranscriptResult> transcribe(std::span<const int16_t> samples, uint32_t sample_rate,
                                        const TranscribeOptions& options = {});
    void stop();

    ServerState state() const;
    Status status() const;
    std::string_view name() const { return backend_->name(); }

    void set_event_callback(EventCallback callback);

private:
    struct LaunchFailure {
        Error error;
        bool early_exit = false;
    };

    Result<void> do_start(const std::string& model_path, const LaunchOptions& options,
                          std::stop_token abort);
    std::expected<void, LaunchFailure> launch(const std::string& binary, bool gpu,
                                              const std::string& model_path,
                                              const LaunchOptions& options,
                                              std::stop_token abort);
    Result<void> wait_ready(const ChildProcess& process, uint16_t port, std::stop_token abort,
                            bool& early_exit);
    void warm_up();
    void health_loop(std::stop_token stop);
    void on_process_exit(pid_t pid, const ExitStatus& status);
    void stop_process();
    void apply(ServerEvent event);       // requires mutex_
    void emit(std::string_view event, const std::string& detail);

    std::unique_ptr<InferenceBackend> backend_;
    Timing timing_;

    mutable std::mutex mutex_;
    ServerState state_ = ServerState::Stopped;
    std::shared_ptr<ChildProcess> process_;
    pid_t pid_ = 0;
    uint16_t port_ = 0;
    std::string model_path_;
    std::string binary_;
    bool gpu_ = false;
    int in_flight_ = 0;
    std::shared_future<Result<void>> startup_;
    std::string startup_model_;
    std::stop_source startup_abort_;
    EventCallback on_event_;

    std::mutex health_mutex_;
    std::condition_variable_any health_cv_;
    std::jthread health_;
};
