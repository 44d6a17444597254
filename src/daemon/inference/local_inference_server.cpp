#include "inference/local_inference_server.hpp"
#include "inference/binary_locator.hpp"
#include "inference/port_allocator.hpp"
#include "util/log.hpp"
#include "util/retry.hpp"
#include "util/strings.hpp"

#include <filesystem>
#include <format>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWarmUpSampleRate = 16000;
constexpr size_t kStartupErrorChars = 200;

} // namespace

LocalInferenceServer::LocalInferenceServer(std::unique_ptr<InferenceBackend> backend)
    : LocalInferenceServer(std::move(backend), Timing{}) {}

LocalInferenceServer::LocalInferenceServer(std::unique_ptr<InferenceBackend> backend, Timing timing)
    : backend_(std::move(backend)), timing_(timing) {}

LocalInferenceServer::~LocalInferenceServer() {
    stop();
}

void LocalInferenceServer::set_event_callback(EventCallback callback) {
    std::lock_guard lock(mutex_);
    on_event_ = std::move(callback);
}

ServerState LocalInferenceServer::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

LocalInferenceServer::Status LocalInferenceServer::status() const {
    std::lock_guard lock(mutex_);
    return Status{
        .state = state_,
        .port = port_,
        .pid = pid_,
        .model_path = model_path_,
        .binary = binary_,
        .gpu = gpu_,
        .in_flight = in_flight_,
    };
}

void LocalInferenceServer::apply(ServerEvent event) {
    auto next = transition(state_, event);
    if (!next) {
        logging::debug("{}: ignoring {} in state {}", backend_->name(), to_string(event), to_string(state_));
        return;
    }
    if (*next != state_) {
        logging::debug("{}: {} -> {}", backend_->name(), to_string(state_), to_string(*next));
    }
    state_ = *next;
}

void LocalInferenceServer::emit(std::string_view event, const std::string& detail) {
    EventCallback cb;
    {
        std::lock_guard lock(mutex_);
        cb = on_event_;
    }
    if (cb) cb(event, detail);
}

Result<void> LocalInferenceServer::start(const std::string& model_path, const LaunchOptions& options) {
    std::promise<Result<void>> promise;
    std::stop_token abort;
    while (true) {
        std::shared_future<Result<void>> pending;
        bool same_model = false;
        {
            std::lock_guard lock(mutex_);
            if (startup_.valid()) {
                pending = startup_;
                same_model = startup_model_ == model_path;
            } else if (accepts_requests(state_) && model_path_ == model_path) {
                return {};
            } else {
                startup_ = promise.get_future().share();
                startup_model_ = model_path;
                startup_abort_ = std::stop_source{};
                abort = startup_abort_.get_token();
                break;
            }
        }

        if (same_model) {
            logging::debug("{}: start already in progress, waiting for it", backend_->name());
            return pending.get();
        }
        // A start for another model is in flight; let it finish, then switch.
        logging::debug("{}: waiting for the current start before switching model", backend_->name());
        pending.wait();
    }

    auto result = do_start(model_path, options, abort);
    {
        std::lock_guard lock(mutex_);
        startup_ = {};
        startup_model_.clear();
    }
    promise.set_value(result);
    return result;
}

Result<void> LocalInferenceServer::do_start(const std::string& model_path,
                                            const LaunchOptions& options,
                                            std::stop_token abort) {
    std::error_code ec;
    if (!fs::exists(model_path, ec)) {
        return make_error(ErrorCode::InvalidArgument, "model not found: " + model_path);
    }

    bool running;
    {
        std::lock_guard lock(mutex_);
        running = process_ != nullptr || state_ != ServerState::Stopped;
    }
    if (running) {
        logging::info("{}: restarting with model {}", backend_->name(), model_path);
        stop_process();
    }

    {
        std::lock_guard lock(mutex_);
        apply(ServerEvent::StartRequested);
        model_path_ = model_path;
    }

    std::vector<BinaryCandidate> found;
    std::string searched;
    for (auto& candidate : backend_->binaries(options.prefer_gpu)) {
        if (!searched.empty()) searched += ", ";
        searched += candidate.name;
        if (auto path = binaries::find(candidate.name, options.bin_dir)) {
            found.push_back({.name = *path, .gpu = candidate.gpu});
        } else {
            logging::debug("{}: {} not found", backend_->name(), candidate.name);
        }
    }
    if (found.empty()) {
        std::lock_guard lock(mutex_);
        apply(ServerEvent::StartupFailed);
        return make_error(ErrorCode::BinaryNotFound,
                          std::format("{} binary not found (looked for {})", backend_->name(), searched));
    }

    for (size_t i = 0; i < found.size(); ++i) {
        auto launched = launch(found[i].name, found[i].gpu, model_path, options, abort);
        if (launched) break;

        bool more = i + 1 < found.size();
        if (found[i].gpu && launched.error().early_exit && more &&
            launched.error().error.code == ErrorCode::ProcessFailed) {
            logging::warn("{}: GPU server failed, falling back to CPU: {}", backend_->name(),
                          launched.error().error.message);
            emit("gpu-fallback", launched.error().error.message);
            continue;
        }

        std::lock_guard lock(mutex_);
        apply(ServerEvent::StartupFailed);
        return std::unexpected(launched.error().error);
    }

    uint16_t port;
    bool gpu;
    {
        std::lock_guard lock(mutex_);
        apply(ServerEvent::BecameReady);
        port = port_;
        gpu = gpu_;
        health_ = std::jthread([this](std::stop_token st) { health_loop(st); });
    }

    logging::info("{}: ready on port {} (model {}{})", backend_->name(), port,
                  fs::path(model_path).filename().string(), gpu ? ", gpu" : "");
    emit("ready", std::to_string(port));

    if (options.warm_up_inference) warm_up();
    return {};
}

std::expected<void, LocalInferenceServer::LaunchFailure>
LocalInferenceServer::launch(const std::string& binary, bool gpu, const std::string& model_path,
                             const LaunchOptions& options, std::stop_token abort) {
    auto port = ports::find_available(backend_->port_range());
    if (!port) return std::unexpected(LaunchFailure{.error = port.error()});

    auto args = backend_->build_args(model_path, *port, options);
    if (!args) return std::unexpected(LaunchFailure{.error = args.error()});

    logging::info("{}: starting {} on port {}", backend_->name(), binary, *port);
    auto spawned = ChildProcess::spawn(binary, *args, std::string(backend_->name()),
                                       [this](pid_t pid, const ExitStatus& st) { on_process_exit(pid, st); });
    if (!spawned) {
        return std::unexpected(LaunchFailure{.error = spawned.error(), .early_exit = true});
    }

    std::shared_ptr<ChildProcess> process = std::move(*spawned);
    {
        std::lock_guard lock(mutex_);
        process_ = process;
        pid_ = process->pid();
        port_ = *port;
        binary_ = binary;
        gpu_ = gpu;
    }

    bool early_exit = false;
    auto ready = wait_ready(*process, *port, abort, early_exit);
    if (ready) {
        std::lock_guard lock(mutex_);
        if (!abort.stop_requested() && process_ == process) return {};
        ready = make_error(ErrorCode::Cancelled, std::string(backend_->name()) + " start cancelled");
    }

    {
        std::lock_guard lock(mutex_);
        if (process_ == process) {
            process_.reset();
            pid_ = 0;
            port_ = 0;
        }
    }
    process->terminate(timing_.stop_grace);
    return std::unexpected(LaunchFailure{.error = ready.error(), .early_exit = early_exit});
}

Result<void> LocalInferenceServer::wait_ready(const ChildProcess& process, uint16_t port,
                                              std::stop_token abort, bool& early_exit) {
    auto timeout = backend_->startup_timeout();
    auto start = std::chrono::steady_clock::now();
    int polls = 0;

    while (std::chrono::steady_clock::now() - start < timeout) {
        if (abort.stop_requested()) {
            return make_error(ErrorCode::Cancelled, std::string(backend_->name()) + " start cancelled");
        }

        if (auto st = process.exit_status()) {
            early_exit = std::chrono::steady_clock::now() - process.started_at() < timing_.early_exit_window;
            auto stderr_text = trim(process.stderr_head(16 * 1024)).substr(0, kStartupErrorChars);
            return make_error(ErrorCode::ProcessFailed,
                              std::format("{} process died during startup: {}", backend_->name(),
                                          stderr_text.empty() ? st->describe() : stderr_text));
        }

        ++polls;
        if (backend_->check_ready(process, port)) {
            logging::debug("{}: ready after {}ms ({} polls)", backend_->name(),
                           std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - start).count(),
                           polls);
            return {};
        }

        interruptible_sleep(timing_.startup_poll, abort);
    }

    return make_error(ErrorCode::Timeout,
                      std::format("{} failed to start within {}ms", backend_->name(), timeout.count()));
}

void LocalInferenceServer::warm_up() {
    size_t count = kWarmUpSampleRate * timing_.warm_up_audio.count() / 1000;
    std::vector<int16_t> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = (i % 2) ? 1 : -1;   // near-silence
    }

    auto start = std::chrono::steady_clock::now();
    auto result = transcribe(samples, kWarmUpSampleRate);
    if (!result) {
        logging::warn("{}: warm-up inference failed: {}", backend_->name(), result.error().message);
        return;
    }
    logging::debug("{}: warm-up inference took {}ms", backend_->name(),
                   std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start).count());
}

Result<TranscriptResult> LocalInferenceServer::transcribe(std::span<const int16_t> samples,
                                                          uint32_t sample_rate,
                                                          const TranscribeOptions& options) {
    if (samples.empty() || sample_rate == 0) {
        return make_error(ErrorCode::InvalidArgument, "empty audio");
    }

    uint16_t port;
    {
        std::lock_guard lock(mutex_);
        if (!accepts_requests(state_)) {
            return make_error(ErrorCode::NotReady,
                              std::format("{} is not running (state: {})", backend_->name(), to_string(state_)));
        }
        port = port_;
        ++in_flight_;
    }

    auto result = backend_->transcribe(port, samples, sample_rate, options);

    {
        std::lock_guard lock(mutex_);
        --in_flight_;
        // A request that timed out counts as a failed health check.
        if (!result && result.error().code == ErrorCode::Timeout && accepts_requests(state_)) {
            logging::warn("{}: transcription timed out, marking degraded", backend_->name());
            apply(ServerEvent::HealthFailed);
        }
    }
    return result;
}

void LocalInferenceServer::health_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(health_mutex_);
            health_cv_.wait_for(lock, stop, timing_.health_interval, [] { return false; });
        }
        if (stop.stop_requested()) break;

        std::shared_ptr<ChildProcess> process;
        uint16_t port;
        {
            std::lock_guard lock(mutex_);
            if (!accepts_requests(state_)) continue;
            if (backend_->skip_health_while_busy() && in_flight_ > 0) continue;
            process = process_;
            port = port_;
        }

        bool alive = process && process->running();
        bool ok = backend_->healthy(port, alive);

        std::lock_guard lock(mutex_);
        if (process != process_) continue;
        if (!ok && state_ == ServerState::Ready) {
            logging::warn("{}: health check failed", backend_->name());
            apply(ServerEvent::HealthFailed);
        } else if (ok && state_ == ServerState::Degraded) {
            logging::info("{}: health check recovered", backend_->name());
            apply(ServerEvent::HealthRecovered);
        }
    }
}

void LocalInferenceServer::on_process_exit(pid_t pid, const ExitStatus& status) {
    bool crashed = false;
    {
        std::lock_guard lock(mutex_);
        if (pid != pid_) return;
        pid_ = 0;
        if (accepts_requests(state_)) {
            apply(ServerEvent::ProcessExited);
            crashed = true;
        }
    }
    if (crashed) {
        logging::warn("{}: process exited unexpectedly ({})", backend_->name(), status.describe());
        emit("crashed", status.describe());
    }
}

void LocalInferenceServer::stop() {
    {
        std::lock_guard lock(mutex_);
        startup_abort_.request_stop();
    }
    stop_process();
}

void LocalInferenceServer::stop_process() {
    std::shared_ptr<ChildProcess> process;
    std::jthread health;
    {
        std::lock_guard lock(mutex_);
        apply(ServerEvent::StopRequested);
        process = std::move(process_);
        health = std::move(health_);
        pid_ = 0;
        port_ = 0;
    }

    if (health.joinable()) {
        health.request_stop();
        health.join();
    }

    if (process) {
        logging::info("{}: stopping pid {}", backend_->name(), process->pid());
        auto st = process->terminate(timing_.stop_grace);
        logging::debug("{}: stopped ({})", backend_->name(), st.describe());
    }
}
