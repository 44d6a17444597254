#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "streaming/protocol.hpp"
#include "support/fake_inference_backend.hpp"
#include "support/fake_ws.hpp"
#include "support/tmp_dir.hpp"
#include "util/asio_executor.hpp"
#include "wav.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

// Collects replies instead of writing them to a socket.
class RecordingIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_command(int, json&) override { return ReadStatus::Disconnected; }
    bool pending_command(int) override { return false; }
    bool send_response(int client_fd, const json& response) override {
        std::lock_guard lock(mutex_);
        replies_.emplace_back(client_fd, response);
        return true;
    }
    void close_client(int) override {}

    std::vector<std::pair<int, json>> replies() const {
        std::lock_guard lock(mutex_);
        return replies_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<int, json>> replies_;
};

struct Harness {
    TmpDir dir{"sl_test_core"};
    AsioExecutor executor;
    FakeWsConnector connector;
    RecordingIpcServer ipc;
    std::shared_ptr<FakeInferenceBackend::Shared> shared = std::make_shared<FakeInferenceBackend::Shared>();
    std::atomic<int> notified{0};
    Config config;
    std::unique_ptr<DaemonCore> core;

    Harness() {
        config.local.bin_dir = dir.file("bin");
        config.local.warm_up_inference = false;
        config.models.cache_dir = dir.file("models");
    }

    ~Harness() {
        core.reset();
    }

    void start() {
        core = std::make_unique<DaemonCore>(
            config,
            DaemonCore::Paths{.models_dir = config.models_dir(), .history_db = dir.file("history.db")},
            ipc, executor, connector,
            [this] { ++notified; },
            [this](ModelFamily family) -> std::unique_ptr<InferenceBackend> {
                return std::make_unique<FakeInferenceBackend>(shared, std::string(to_string(family)) + "-fake");
            });
        REQUIRE(core->init());
    }

    // Sends a command and returns its reply, reaping jobs until a deferred one arrives.
    json command(json cmd, int fd = 5) {
        auto name = cmd.value("cmd", "");
        auto reply = core->handle_command(fd, name, cmd);
        if (reply) return *reply;
        auto deferred = wait_reply(fd);
        REQUIRE(deferred.has_value());
        return *deferred;
    }

    std::optional<json> wait_reply(int fd, std::chrono::milliseconds timeout = 10000ms) {
        auto seen = ipc.replies().size();
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            core->on_jobs_complete();
            auto replies = ipc.replies();
            for (size_t i = seen; i < replies.size(); ++i) {
                if (replies[i].first == fd) return replies[i].second;
            }
            std::this_thread::sleep_for(5ms);
        }
        return std::nullopt;
    }

    void drain_jobs() {
        auto deadline = std::chrono::steady_clock::now() + 10s;
        while (core->active_jobs() > 0 && std::chrono::steady_clock::now() < deadline) {
            core->on_jobs_complete();
            std::this_thread::sleep_for(5ms);
        }
    }

    // Waits until `pred` holds on the executor thread.
    template <typename Pred>
    bool wait_on_executor(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            bool ok = false;
            executor.run_sync([&] { ok = pred(); });
            if (ok) return true;
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    std::string wav_file(const std::string& name, size_t samples, uint32_t rate = 16000) {
        std::vector<int16_t> pcm(samples, 200);
        auto bytes = wav::encode(pcm, rate);
        return dir.write(name, std::string(bytes.begin(), bytes.end()));
    }

    void install_whisper_base() {
        dir.write("models/whisper/base/ggml-base.bin", "weights");
    }

    void fake_server() {
        dir.script("bin/fake-cpu", "echo listening\nexec sleep 30");
    }
};

} // namespace

TEST_CASE("DaemonCore commands", "[daemon_core]") {
    Harness h;
    h.start();

    SECTION("Status") {
        auto resp = h.command({{"cmd", "status"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["streaming"]["state"] == "cold");
        REQUIRE(resp["streaming"]["dictating"] == false);
        REQUIRE(resp["local"]["whisper"]["state"] == "stopped");
        REQUIRE(resp["local"]["parakeet"]["state"] == "stopped");
        REQUIRE(resp["jobs"] == 0);
        REQUIRE_FALSE(resp.contains("download"));
    }

    SECTION("UnknownCommand") {
        auto resp = h.command({{"cmd", "explode"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "invalid_argument");
        REQUIRE(resp["message"] == "unknown command: explode");
    }

    SECTION("WrongFieldType") {
        auto resp = h.command({{"cmd", "history"}, {"limit", "ten"}});
        REQUIRE(resp["code"] == "invalid_argument");
        REQUIRE(resp["message"].get<std::string>().starts_with("bad command"));
    }

    SECTION("ModelsList") {
        auto resp = h.command({{"cmd", "models"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["models"].size() == model_catalog::builtin().size());
        bool saw_base = false;
        for (auto& m : resp["models"]) {
            if (m["backend"] == "whisper" && m["id"] == "base") {
                saw_base = true;
                REQUIRE(m["installed"] == false);
            }
        }
        REQUIRE(saw_base);

        h.install_whisper_base();
        resp = h.command({{"cmd", "models"}});
        for (auto& m : resp["models"]) {
            if (m["id"] == "base") REQUIRE(m["installed"] == true);
        }
    }

    SECTION("FinalizeWithoutDictation") {
        auto resp = h.command({{"cmd", "finalize"}});
        REQUIRE(resp["code"] == "not_ready");
    }

    SECTION("CancelDownloadWithoutDownload") {
        auto resp = h.command({{"cmd", "cancel-download"}});
        REQUIRE(resp["code"] == "invalid_argument");
    }

    SECTION("DownloadRequiresModel") {
        auto resp = h.command({{"cmd", "download"}});
        REQUIRE(resp["code"] == "invalid_argument");
        resp = h.command({{"cmd", "download"}, {"model", "gigantic"}});
        REQUIRE(resp["code"] == "invalid_argument");
        REQUIRE(resp["message"] == "unknown whisper model: gigantic");
    }

    SECTION("RemoveModelNotInstalled") {
        auto resp = h.command({{"cmd", "remove-model"}, {"model", "tiny"}});
        REQUIRE(resp["code"] == "invalid_argument");
    }

    SECTION("ServerStopWhenStopped") {
        auto resp = h.core->handle_command(5, "server-stop", {{"cmd", "server-stop"}});
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["status"] == "ok");
        REQUIRE(h.core->active_jobs() == 0);
    }

    SECTION("UnknownBackend") {
        auto resp = h.command({{"cmd", "server-start"}, {"backend", "kaldi"}});
        REQUIRE(resp["code"] == "invalid_argument");
    }

    SECTION("WarmupWithoutToken") {
        auto resp = h.command({{"cmd", "warmup"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "authentication");
    }

    SECTION("EmptyHistory") {
        auto resp = h.command({{"cmd", "history"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["entries"].empty());
    }

    SECTION("ErrorReplyCarriesHttpStatus") {
        auto resp = DaemonCore::error_reply({.code = ErrorCode::HttpStatus, .message = "HTTP 404", .http_status = 404});
        REQUIRE(resp["code"] == "http_status");
        REQUIRE(resp["http_status"] == 404);
        REQUIRE_FALSE(DaemonCore::error_reply({.code = ErrorCode::Io, .message = "x"}).contains("http_status"));
    }
}

TEST_CASE("DaemonCore local transcription", "[daemon_core]") {
    Harness h;
    h.start();
    auto audio = h.wav_file("clip.wav", 4800);

    SECTION("MissingFile") {
        auto resp = h.command({{"cmd", "transcribe"}});
        REQUIRE(resp["code"] == "invalid_argument");
    }

    SECTION("ModelNotInstalled") {
        auto resp = h.command({{"cmd", "transcribe"}, {"file", audio}});
        REQUIRE(resp["code"] == "not_ready");
        REQUIRE(resp["message"].get<std::string>().find("base") != std::string::npos);
    }

    SECTION("UnreadableAudio") {
        h.install_whisper_base();
        auto resp = h.command({{"cmd", "transcribe"}, {"file", h.dir.file("absent.wav")}});
        REQUIRE(resp["code"] == "io");
    }

    SECTION("TranscribesAndRecordsHistory") {
        h.install_whisper_base();
        h.fake_server();

        auto resp = h.command({{"cmd", "transcribe"}, {"file", audio}, {"language", "de"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["text"].get<std::string>().ends_with(":4800:de"));
        REQUIRE(resp["duration"] == 0.3);

        auto status = h.command({{"cmd", "status"}});
        REQUIRE(status["local"]["whisper"]["state"] == "ready");
        REQUIRE(status["local"]["whisper"]["name"] == "whisper-fake");

        auto history = h.command({{"cmd", "history"}, {"limit", 5}});
        REQUIRE(history["entries"].size() == 1);
        REQUIRE(history["entries"][0]["backend"] == "whisper");
        REQUIRE(history["entries"][0]["model"] == "base");
        REQUIRE(history["entries"][0]["text"] == resp["text"]);
    }

    SECTION("ServerStartAndStop") {
        h.install_whisper_base();
        h.fake_server();

        auto started = h.command({{"cmd", "server-start"}});
        REQUIRE(started["status"] == "ok");
        REQUIRE(started["server"]["state"] == "ready");

        auto stopped = h.command({{"cmd", "server-stop"}});
        REQUIRE(stopped["status"] == "ok");
        REQUIRE(h.command({{"cmd", "status"}})["local"]["whisper"]["state"] == "stopped");
    }

    SECTION("RemoveModelStopsItsServer") {
        h.install_whisper_base();
        h.fake_server();
        REQUIRE(h.command({{"cmd", "server-start"}})["status"] == "ok");

        auto resp = h.command({{"cmd", "remove-model"}, {"model", "base"}});
        REQUIRE(resp["status"] == "ok");
        auto status = h.command({{"cmd", "status"}});
        REQUIRE(status["local"]["whisper"]["state"] == "stopped");
    }

    SECTION("ReplyDroppedWhenClientLeaves") {
        h.install_whisper_base();
        h.fake_server();
        REQUIRE_FALSE(h.core->handle_command(9, "transcribe", {{"cmd", "transcribe"}, {"file", audio}}).has_value());
        h.core->remove_client(9);
        h.drain_jobs();
        REQUIRE(h.ipc.replies().empty());

        // History is still written for the finished job
        auto history = h.command({{"cmd", "history"}});
        REQUIRE(history["entries"].size() == 1);
    }
}

TEST_CASE("DaemonCore streaming dictation", "[daemon_core]") {
    Harness h;
    h.dir.write("token", "secret-token\n");
    h.config.streaming.token_file = h.dir.file("token");
    h.config.audio.chunk_ms = 100;
    h.start();

    SECTION("MissingFile") {
        auto resp = h.command({{"cmd", "dictate"}, {"file", h.dir.file("absent.wav")}});
        REQUIRE(resp["code"] == "io");
    }

    SECTION("StreamsFileAndReturnsTranscript") {
        auto audio = h.wav_file("speech.wav", 4800);
        REQUIRE_FALSE(h.core->handle_command(5, "dictate", {{"cmd", "dictate"}, {"file", audio}}).has_value());

        REQUIRE(h.wait_on_executor([&] { return h.connector.count() == 1; }));
        auto conn = h.connector.last();
        std::string auth;
        h.executor.run_sync([&] {
            auth = conn->request().headers.at(0).second;
            conn->open();
        });
        REQUIRE(auth == "Bearer secret-token");

        // A second dictation is refused while this one runs
        auto busy = h.core->handle_command(6, "dictate", {{"cmd", "dictate"}, {"file", audio}});
        REQUIRE(busy.has_value());
        REQUIRE((*busy)["code"] == "not_ready");

        REQUIRE(h.wait_on_executor([&] {
            return conn->count_text(listen_protocol::close_stream_message()) == 1;
        }));
        size_t frames = 0, first_frame = 0, finalizes = 0;
        h.executor.run_sync([&] {
            frames = conn->binary().size();
            first_frame = frames ? conn->binary()[0].size() : 0;
            finalizes = conn->count_text(listen_protocol::finalize_message());
            conn->text(R"({"type":"Results","is_final":true,"channel":{"alternatives":[{"transcript":"hello"}]}})");
            conn->text(R"({"type":"Results","from_finalize":true,"channel":{"alternatives":[{"transcript":"world"}]}})");
            conn->server_close(1000);
        });
        REQUIRE(frames == 3);
        REQUIRE(first_frame == 3200);
        REQUIRE(finalizes == 1);

        auto resp = h.wait_reply(5);
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["status"] == "ok");
        REQUIRE((*resp)["text"] == "hello world");
        REQUIRE((*resp)["duration"] == 0.3);

        auto history = h.command({{"cmd", "history"}});
        REQUIRE(history["entries"].size() == 1);
        REQUIRE(history["entries"][0]["backend"] == "streaming");
        REQUIRE(history["entries"][0]["model"] == "nova-3");
    }

    SECTION("WarmupOpensSocket") {
        REQUIRE_FALSE(h.core->handle_command(5, "warmup", {{"cmd", "warmup"}}).has_value());
        REQUIRE(h.wait_on_executor([&] { return h.connector.count() == 1; }));
        h.executor.run_sync([&] { h.connector.last()->open(); });

        auto resp = h.wait_reply(5);
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["status"] == "ok");

        auto status = h.command({{"cmd", "status"}});
        REQUIRE(status["streaming"]["warm"] == true);
        REQUIRE(status["streaming"]["credential_valid"] == true);
    }
}
