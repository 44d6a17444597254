#pragma once

#include "config.hpp"
#include "inference/inference_backend.hpp"
#include "inference/local_inference_server.hpp"
#include "models/model_catalog.hpp"
#include "models/model_installer.hpp"
#include "models/model_provisioner.hpp"
#include "platform/ipc_server.hpp"
#include "storage/history_db.hpp"
#include "streaming/streaming_session.hpp"
#include "streaming/ws_transport.hpp"
#include "util/error.hpp"
#include "util/executor.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

// Portable daemon logic: owns the streaming session, the local inference
// servers, the model cache and the history database, and maps IPC commands
// onto them. Called from the event loop thread only; long commands run as
// jobs on their own threads and report back through the notify callback.
class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;
    using BackendFactory = std::function<std::unique_ptr<InferenceBackend>(ModelFamily)>;

    struct Paths {
        std::string models_dir;
        std::string history_db;     // empty disables history
    };

    DaemonCore(Config config, Paths paths, IpcServer& ipc,
               Executor& executor, WsConnector& connector,
               NotifyCallback notify, BackendFactory backends = {});
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // Returns the reply, or nullopt when the reply is sent later from
    // on_jobs_complete().
    std::optional<nlohmann::json> handle_command(int client_fd, const std::string& cmd_str,
                                                 const nlohmann::json& cmd);

    // Reaps finished jobs and delivers their replies.
    void on_jobs_complete();

    void remove_client(int fd);

    size_t active_jobs() const { return jobs_.size(); }

    void shutdown();

    static nlohmann::json error_reply(const Error& err);

private:
    struct HistoryRecord {
        std::string text;
        double audio_duration = 0.0;
        double processing_time = 0.0;
        std::string backend;
        std::string model;
    };

    struct Job {
        uint64_t id = 0;
        std::string kind;
        int client_fd = -1;     // -1 once the client is gone or for background jobs
        nlohmann::json reply;
        std::optional<HistoryRecord> history;
        std::atomic<bool> done{false};
        std::jthread thread;
    };

    using JobBody = std::function<nlohmann::json(std::stop_token, Job&)>;

    nlohmann::json handle_status(const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_warmup(int client_fd, const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_dictate(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_finalize(const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_transcribe(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_models(const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_download(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_cancel_download(const nlohmann::json& cmd);
    nlohmann::json handle_remove_model(const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_server_start(int client_fd, const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_server_stop(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);

    Job& start_job(int client_fd, std::string kind, JobBody body);

    // Resolves "backend"/"model" fields against the config defaults.
    Result<const ModelInfo*> resolve_model(const nlohmann::json& cmd) const;
    Result<ModelFamily> resolve_family(const nlohmann::json& cmd) const;
    LocalInferenceServer& server(ModelFamily family);
    Result<void> ensure_server(const ModelInfo& model);
    LaunchOptions launch_options() const;

    StreamingOptions streaming_options(const nlohmann::json& cmd) const;
    void refresh_token(StreamingSession::TokenCallback done) const;

    Config config_;
    Paths paths_;
    IpcServer& ipc_;
    NotifyCallback notify_;
    BackendFactory backends_;

    StreamingSession session_;
    ModelProvisioner provisioner_;
    ModelInstaller installer_;
    std::map<ModelFamily, std::unique_ptr<LocalInferenceServer>> servers_;
    HistoryDb history_db_;

    std::list<std::unique_ptr<Job>> jobs_;
    uint64_t next_job_id_ = 1;

    std::atomic<bool> dictating_{false};

    struct DownloadProgress {
        uint64_t job_id = 0;
        std::string model;
        uint64_t downloaded = 0;
        uint64_t total = 0;
    };
    mutable std::mutex download_mutex_;
    std::optional<DownloadProgress> download_;

    bool shut_down_ = false;
};
