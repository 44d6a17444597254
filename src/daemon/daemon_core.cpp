#include "daemon_core.hpp"

#include "inference/sherpa_ws_backend.hpp"
#include "inference/whisper_server_backend.hpp"
#include "util/log.hpp"
#include "util/strings.hpp"
#include "wav.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

std::unique_ptr<InferenceBackend> default_backend(ModelFamily family) {
    if (family == ModelFamily::Parakeet) return std::make_unique<SherpaWsBackend>();
    return std::make_unique<WhisperServerBackend>();
}

StreamingConfig streaming_config(const Config& config) {
    StreamingConfig sc;
    sc.url = config.streaming.url;
    return sc;
}

json server_status_json(const LocalInferenceServer& server) {
    auto st = server.status();
    json j = {
        {"name", std::string(server.name())},
        {"state", std::string(to_string(st.state))},
        {"in_flight", st.in_flight},
    };
    if (st.state != ServerState::Stopped) {
        j["port"] = st.port;
        j["pid"] = st.pid;
        j["model"] = st.model_path;
        j["binary"] = st.binary;
        j["gpu"] = st.gpu;
    }
    return j;
}

json transcript_json(const TranscriptResult& tr) {
    return {
        {"status", "ok"},
        {"text", tr.text},
        {"duration", tr.duration_s},
        {"processing_time", tr.processing_s},
    };
}

} // namespace

DaemonCore::DaemonCore(Config config, Paths paths, IpcServer& ipc,
                       Executor& executor, WsConnector& connector,
                       NotifyCallback notify, BackendFactory backends)
    : config_(std::move(config)), paths_(std::move(paths)), ipc_(ipc),
      notify_(std::move(notify)),
      backends_(backends ? std::move(backends) : BackendFactory(default_backend)),
      session_(executor, connector, streaming_config(config_)),
      installer_(paths_.models_dir, provisioner_) {
    // Both servers exist up front so job threads only ever read the map.
    for (auto family : {ModelFamily::Whisper, ModelFamily::Parakeet}) {
        auto srv = std::make_unique<LocalInferenceServer>(backends_(family));
        srv->set_event_callback([family](std::string_view event, const std::string& detail) {
            if (event == "crashed" || event == "gpu-fallback") {
                logging::warn("{}: {}{}", to_string(family), event, detail.empty() ? "" : ": " + detail);
            } else {
                logging::info("{}: {}{}", to_string(family), event, detail.empty() ? "" : ": " + detail);
            }
        });
        servers_.emplace(family, std::move(srv));
    }
}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    session_.set_token_refresher([this](StreamingSession::TokenCallback done) { refresh_token(std::move(done)); });
    session_.set_callbacks({
        .on_partial = [](const std::string& text) { logging::debug("streaming: partial \"{}\"", text); },
        .on_final = [](const std::string& text) { logging::debug("streaming: final \"{}\"", text); },
        .on_error = [](const Error& err) { logging::warn("streaming: {}", err.message); },
    });

    if (!paths_.history_db.empty() && !history_db_.open(paths_.history_db)) {
        logging::warn("history DB failed to open, history disabled");
    }

    int swept = installer_.sweep();
    if (swept > 0) logging::info("models: removed {} stale download leftovers", swept);

    if (config_.streaming.prewarm && !config_.streaming.token_file.empty()) {
        start_job(-1, "warmup", [this](std::stop_token, Job&) -> json {
            auto result = session_.warmup({}, streaming_options(json::object())).get();
            if (!result) {
                logging::warn("streaming: prewarm failed: {}", result.error().message);
                return error_reply(result.error());
            }
            return {{"status", "ok"}};
        });
    }

    if (config_.local.prewarm) {
        json cmd = json::object();
        auto model = resolve_model(cmd);
        if (!model) {
            logging::warn("local: prewarm skipped: {}", model.error().message);
        } else if (!installer_.is_installed(**model)) {
            logging::info("local: prewarm skipped, {} is not installed", (*model)->id);
        } else {
            start_job(-1, "server-start", [this, m = *model](std::stop_token, Job&) -> json {
                auto started = ensure_server(*m);
                if (!started) {
                    logging::warn("local: prewarm failed: {}", started.error().message);
                    return error_reply(started.error());
                }
                return {{"status", "ok"}};
            });
        }
    }

    return true;
}

std::optional<json> DaemonCore::handle_command(int client_fd, const std::string& cmd_str,
                                               const json& cmd) {
    if (shut_down_) return error_reply({.code = ErrorCode::NotReady, .message = "daemon is shutting down"});

    try {
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "warmup") return handle_warmup(client_fd, cmd);
        if (cmd_str == "dictate") return handle_dictate(client_fd, cmd);
        if (cmd_str == "finalize") return handle_finalize(cmd);
        if (cmd_str == "transcribe") return handle_transcribe(client_fd, cmd);
        if (cmd_str == "models") return handle_models(cmd);
        if (cmd_str == "download") return handle_download(client_fd, cmd);
        if (cmd_str == "cancel-download") return handle_cancel_download(cmd);
        if (cmd_str == "remove-model") return handle_remove_model(cmd);
        if (cmd_str == "server-start") return handle_server_start(client_fd, cmd);
        if (cmd_str == "server-stop") return handle_server_stop(client_fd, cmd);
        if (cmd_str == "history") return handle_history(cmd);
    } catch (const json::exception& e) {
        // Wrong field types in an otherwise valid command
        return error_reply({.code = ErrorCode::InvalidArgument, .message = std::string("bad command: ") + e.what()});
    }
    return error_reply({.code = ErrorCode::InvalidArgument, .message = "unknown command: " + cmd_str});
}

json DaemonCore::error_reply(const Error& err) {
    json j = {
        {"status", "error"},
        {"code", std::string(to_string(err.code))},
        {"message", err.message},
    };
    if (err.http_status != 0) j["http_status"] = err.http_status;
    return j;
}

// Commands

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}};

    auto fut = session_.status();
    if (fut.wait_for(std::chrono::seconds(2)) == std::future_status::ready) {
        auto st = fut.get();
        resp["streaming"] = {
            {"state", std::string(to_string(st.state))},
            {"connected", st.connected},
            {"warm", st.warm},
            {"credential_valid", st.credential_valid},
            {"session_id", st.session_id},
            {"rewarm_attempts", st.rewarm_attempts},
            {"audio_bytes_sent", st.audio_bytes_sent},
            {"dictating", dictating_.load()},
        };
    } else {
        resp["streaming"] = {{"state", "unresponsive"}};
    }

    resp["local"] = json::object();
    for (auto& [family, srv] : servers_) {
        resp["local"][std::string(to_string(family))] = server_status_json(*srv);
    }

    {
        std::lock_guard lock(download_mutex_);
        if (download_) {
            resp["download"] = {
                {"model", download_->model},
                {"downloaded", download_->downloaded},
                {"total", download_->total},
            };
        }
    }

    resp["jobs"] = jobs_.size();
    return resp;
}

std::optional<json> DaemonCore::handle_warmup(int client_fd, const json& cmd) {
    if (dictating_) {
        return error_reply({.code = ErrorCode::NotReady, .message = "dictation in progress"});
    }
    auto options = streaming_options(cmd);
    std::string token = cmd.value("token", "");

    start_job(client_fd, "warmup", [this, options, token](std::stop_token, Job&) -> json {
        auto result = session_.warmup(token, options).get();
        if (!result) return error_reply(result.error());
        return {{"status", "ok"}, {"message", "warm"}};
    });
    return std::nullopt;
}

std::optional<json> DaemonCore::handle_dictate(int client_fd, const json& cmd) {
    auto file = cmd.value("file", "");
    if (file.empty()) {
        return error_reply({.code = ErrorCode::InvalidArgument, .message = "dictate requires \"file\""});
    }
    auto audio = wav::read_file(file);
    if (!audio) return error_reply(audio.error());

    bool expected = false;
    if (!dictating_.compare_exchange_strong(expected, true)) {
        return error_reply({.code = ErrorCode::NotReady, .message = "dictation already in progress"});
    }

    auto options = streaming_options(cmd);
    options.sample_rate = audio->sample_rate;
    auto chunk_ms = std::max<uint32_t>(config_.audio.chunk_ms, 10);

    start_job(client_fd, "dictate",
              [this, options, chunk_ms, audio = std::move(*audio)](std::stop_token stop, Job& job) -> json {
        struct Release {
            std::atomic<bool>& flag;
            ~Release() { flag = false; }
        } release{dictating_};

        auto t0 = std::chrono::steady_clock::now();
        auto connected = session_.connect(options).get();
        if (!connected) return error_reply(connected.error());

        size_t chunk_samples = std::max<size_t>(1, audio.sample_rate * chunk_ms / 1000);
        for (size_t pos = 0; pos < audio.samples.size(); pos += chunk_samples) {
            if (stop.stop_requested()) {
                session_.disconnect(false).get();
                return error_reply({.code = ErrorCode::Cancelled, .message = "dictation cancelled"});
            }
            size_t n = std::min(chunk_samples, audio.samples.size() - pos);
            auto* bytes = reinterpret_cast<const uint8_t*>(audio.samples.data() + pos);
            session_.send_audio(std::vector<uint8_t>(bytes, bytes + n * sizeof(int16_t)));
        }

        session_.finalize();
        auto text = session_.disconnect(true).get();
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

        auto model = listen_protocol::select_model(options.language);
        logging::info("dictation complete: {:.1f}s audio, {} chars", audio.duration_s(), text.size());
        job.history = HistoryRecord{
            .text = text,
            .audio_duration = audio.duration_s(),
            .processing_time = elapsed,
            .backend = "streaming",
            .model = model,
        };
        return transcript_json({.text = text, .duration_s = audio.duration_s(), .processing_s = elapsed});
    });
    return std::nullopt;
}

json DaemonCore::handle_finalize(const json& /*cmd*/) {
    if (!dictating_) {
        return error_reply({.code = ErrorCode::NotReady, .message = "no dictation in progress"});
    }
    session_.finalize();
    return {{"status", "ok"}};
}

std::optional<json> DaemonCore::handle_transcribe(int client_fd, const json& cmd) {
    auto file = cmd.value("file", "");
    if (file.empty()) {
        return error_reply({.code = ErrorCode::InvalidArgument, .message = "transcribe requires \"file\""});
    }
    auto model = resolve_model(cmd);
    if (!model) return error_reply(model.error());
    if (!installer_.is_installed(**model)) {
        return error_reply({.code = ErrorCode::NotReady,
                            .message = "model " + (*model)->id + " is not installed; run download first"});
    }
    auto audio = wav::read_file(file);
    if (!audio) return error_reply(audio.error());

    TranscribeOptions options{
        .language = cmd.value("language", config_.local.language),
        .prompt = cmd.value("prompt", ""),
    };

    start_job(client_fd, "transcribe",
              [this, m = *model, options, audio = std::move(*audio)](std::stop_token, Job& job) -> json {
        auto started = ensure_server(*m);
        if (!started) return error_reply(started.error());

        auto result = server(m->family).transcribe(audio.samples, audio.sample_rate, options);
        if (!result) return error_reply(result.error());

        logging::info("transcription complete: {:.1f}s processing, {} chars",
                      result->processing_s, result->text.size());
        job.history = HistoryRecord{
            .text = result->text,
            .audio_duration = result->duration_s,
            .processing_time = result->processing_s,
            .backend = std::string(to_string(m->family)),
            .model = m->id,
        };
        return transcript_json(*result);
    });
    return std::nullopt;
}

json DaemonCore::handle_models(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"models", json::array()}};
    for (auto& e : installer_.list()) {
        resp["models"].push_back({
            {"backend", std::string(to_string(e.info->family))},
            {"id", e.info->id},
            {"size_bytes", e.info->size_bytes},
            {"installed", e.installed},
            {"path", e.path},
        });
    }
    return resp;
}

std::optional<json> DaemonCore::handle_download(int client_fd, const json& cmd) {
    if (!cmd.contains("model")) {
        return error_reply({.code = ErrorCode::InvalidArgument, .message = "download requires \"model\""});
    }
    auto model = resolve_model(cmd);
    if (!model) return error_reply(model.error());

    std::lock_guard lock(download_mutex_);
    if (download_) {
        return error_reply({.code = ErrorCode::NotReady,
                            .message = "download of " + download_->model + " already in progress"});
    }
    download_ = DownloadProgress{.job_id = next_job_id_, .model = (*model)->id};

    RetryPolicy retry;
    retry.max_retries = config_.models.max_retries;

    start_job(client_fd, "download", [this, m = *model, retry](std::stop_token stop, Job& job) -> json {
        auto on_progress = [this, id = job.id](const ModelInfo&, uint64_t done, uint64_t total) {
            std::lock_guard lock(download_mutex_);
            if (download_ && download_->job_id == id) {
                download_->downloaded = done;
                download_->total = total;
            }
        };
        auto result = installer_.install(*m, stop, on_progress, retry);
        {
            std::lock_guard lock(download_mutex_);
            if (download_ && download_->job_id == job.id) download_.reset();
        }
        if (!result) return error_reply(result.error());
        return {{"status", "ok"}, {"model", m->id}, {"path", *result}};
    });
    return std::nullopt;
}

json DaemonCore::handle_cancel_download(const json& /*cmd*/) {
    auto it = std::ranges::find_if(jobs_, [](const std::unique_ptr<Job>& j) {
        return j->kind == "download" && !j->done;
    });
    if (it == jobs_.end()) {
        return error_reply({.code = ErrorCode::InvalidArgument, .message = "no download in progress"});
    }
    (*it)->thread.request_stop();
    logging::info("download cancellation requested");
    return {{"status", "ok"}, {"message", "cancelling"}};
}

json DaemonCore::handle_remove_model(const json& cmd) {
    if (!cmd.contains("model")) {
        return error_reply({.code = ErrorCode::InvalidArgument, .message = "remove-model requires \"model\""});
    }
    auto model = resolve_model(cmd);
    if (!model) return error_reply(model.error());

    {
        std::lock_guard lock(download_mutex_);
        if (download_ && download_->model == (*model)->id) {
            return error_reply({.code = ErrorCode::NotReady, .message = "model " + (*model)->id + " is downloading"});
        }
    }

    auto& srv = server((*model)->family);
    if (srv.status().model_path == installer_.model_path(**model)) {
        logging::info("stopping {} before removing {}", srv.name(), (*model)->id);
        srv.stop();
    }

    auto removed = installer_.remove(**model);
    if (!removed) return error_reply(removed.error());
    return {{"status", "ok"}};
}

std::optional<json> DaemonCore::handle_server_start(int client_fd, const json& cmd) {
    auto model = resolve_model(cmd);
    if (!model) return error_reply(model.error());
    if (!installer_.is_installed(**model)) {
        return error_reply({.code = ErrorCode::NotReady,
                            .message = "model " + (*model)->id + " is not installed; run download first"});
    }

    start_job(client_fd, "server-start", [this, m = *model](std::stop_token, Job&) -> json {
        auto started = ensure_server(*m);
        if (!started) return error_reply(started.error());
        json resp = {{"status", "ok"}};
        resp["server"] = server_status_json(server(m->family));
        return resp;
    });
    return std::nullopt;
}

std::optional<json> DaemonCore::handle_server_stop(int client_fd, const json& cmd) {
    auto family = resolve_family(cmd);
    if (!family) return error_reply(family.error());

    auto& srv = server(*family);
    if (srv.state() == ServerState::Stopped) return json{{"status", "ok"}};

    start_job(client_fd, "server-stop", [&srv](std::stop_token, Job&) -> json {
        srv.stop();
        return {{"status", "ok"}};
    });
    return std::nullopt;
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = cmd.value("limit", 10);
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
            {"backend", e.backend},
            {"model", e.model},
        });
    }
    return resp;
}

// Jobs

DaemonCore::Job& DaemonCore::start_job(int client_fd, std::string kind, JobBody body) {
    auto job = std::make_unique<Job>();
    job->id = next_job_id_++;
    job->kind = std::move(kind);
    job->client_fd = client_fd;

    Job& ref = *job;
    jobs_.push_back(std::move(job));
    logging::debug("job {} ({}) started", ref.id, ref.kind);

    ref.thread = std::jthread([this, &ref, body = std::move(body)](std::stop_token stop) {
        ref.reply = body(stop, ref);
        ref.done.store(true, std::memory_order_release);
        notify_();
    });
    return ref;
}

void DaemonCore::on_jobs_complete() {
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        auto& job = **it;
        if (!job.done.load(std::memory_order_acquire)) {
            ++it;
            continue;
        }
        if (job.thread.joinable()) job.thread.join();

        if (job.history && history_db_.is_open()) {
            auto& h = *job.history;
            history_db_.insert(h.text, h.audio_duration, h.processing_time, h.backend, h.model);
        }

        if (job.client_fd >= 0 && !ipc_.send_response(job.client_fd, job.reply)) {
            logging::warn("job {} ({}): client {} went away before the reply", job.id, job.kind, job.client_fd);
        }
        logging::debug("job {} ({}) finished: {}", job.id, job.kind, job.reply.value("status", ""));
        it = jobs_.erase(it);
    }
}

void DaemonCore::remove_client(int fd) {
    for (auto& job : jobs_) {
        if (job->client_fd == fd) job->client_fd = -1;
    }
}

void DaemonCore::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    for (auto& job : jobs_) job->thread.request_stop();

    // Unblocks jobs waiting on a server start or a streaming future
    for (auto& [family, srv] : servers_) srv->stop();
    session_.shutdown().get();

    if (!jobs_.empty()) logging::info("waiting for {} pending jobs", jobs_.size());
    for (auto& job : jobs_) {
        if (job->thread.joinable()) job->thread.join();
    }
    on_jobs_complete();
}

// Helpers

Result<ModelFamily> DaemonCore::resolve_family(const json& cmd) const {
    auto name = cmd.value("backend", config_.local.backend);
    auto family = parse_model_family(name);
    if (!family) {
        return make_error(ErrorCode::InvalidArgument, "unknown backend: " + name + " (expected whisper or parakeet)");
    }
    return *family;
}

Result<const ModelInfo*> DaemonCore::resolve_model(const json& cmd) const {
    auto family = resolve_family(cmd);
    if (!family) return std::unexpected(family.error());

    auto fallback = *family == ModelFamily::Parakeet ? config_.local.parakeet_model : config_.local.whisper_model;
    auto id = cmd.value("model", fallback);
    auto* model = installer_.find(*family, id);
    if (!model) {
        return make_error(ErrorCode::InvalidArgument,
                          "unknown " + std::string(to_string(*family)) + " model: " + id);
    }
    return model;
}

LocalInferenceServer& DaemonCore::server(ModelFamily family) {
    return *servers_.at(family);
}

Result<void> DaemonCore::ensure_server(const ModelInfo& model) {
    return server(model.family).start(installer_.model_path(model), launch_options());
}

LaunchOptions DaemonCore::launch_options() const {
    return {
        .bin_dir = config_.local.bin_dir,
        .language = config_.local.language,
        .threads = config_.local.threads,
        .prefer_gpu = config_.local.prefer_gpu,
        .warm_up_inference = config_.local.warm_up_inference,
    };
}

StreamingOptions DaemonCore::streaming_options(const json& cmd) const {
    StreamingOptions options;
    options.language = cmd.value("language", config_.streaming.language);
    options.sample_rate = config_.streaming.sample_rate;
    options.keyterms = config_.streaming.keyterms;
    return options;
}

void DaemonCore::refresh_token(StreamingSession::TokenCallback done) const {
    if (config_.streaming.token_file.empty()) {
        done(make_error(ErrorCode::Authentication, "no streaming token available (set streaming.token_file)"));
        return;
    }
    std::ifstream f(config_.streaming.token_file);
    if (!f.is_open()) {
        done(make_error(ErrorCode::Authentication, "cannot read token file " + config_.streaming.token_file));
        return;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    auto token = trim(ss.str());
    if (token.empty()) {
        done(make_error(ErrorCode::Authentication, "token file " + config_.streaming.token_file + " is empty"));
        return;
    }
    done(std::move(token));
}
