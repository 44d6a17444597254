#pragma once

#include "streaming/audio_frame_buffer.hpp"
#include "streaming/credential.hpp"
#include "streaming/protocol.hpp"
#include "streaming/ws_transport.hpp"
#include "util/error.hpp"
#include "util/executor.hpp"
#include "util/retry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

enum class ConnectionState {
    Cold,
    Warming,
    WarmIdle,
    Active,
    Closing,
    Closed,
};

std::string_view to_string(ConnectionState state);

struct StreamingConfig {
    std::string url = std::string(listen_protocol::kDefaultUrl);
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds termination_timeout{5000};
    std::chrono::milliseconds keepalive_interval{3000};
    std::chrono::milliseconds liveness_timeout{2500};
    std::chrono::milliseconds credential_lifetime = CredentialCache::kDefaultLifetime;
    std::chrono::milliseconds credential_margin = CredentialCache::kDefaultValidityMargin;
    // Proactive refresh fires this long before the credential expires.
    std::chrono::milliseconds refresh_margin{60000};
    // Cold-start and replay buffers each hold this much audio.
    std::chrono::milliseconds buffer_audio{3000};
    RetryPolicy rewarm{.max_retries = 10,
                       .base_delay = std::chrono::milliseconds(2000),
                       .max_delay = std::chrono::milliseconds(60000)};
};

struct SessionStatus {
    ConnectionState state = ConnectionState::Cold;
    bool connected = false;
    bool warm = false;
    bool credential_valid = false;
    std::string session_id;
    int rewarm_attempts = 0;
    uint64_t audio_bytes_sent = 0;
};

// Real-time streaming transcription over a WebSocket, with a pre-warmed
// socket kept ahead of need. All state lives on the executor thread; public
// calls post there and report through futures and callbacks.
class StreamingSession {
public:
    using TokenCallback = std::function<void(Result<std::string>)>;
    // Asks the owner for a fresh bearer token. May complete on any thread.
    using TokenRefresher = std::function<void(TokenCallback)>;

    struct Callbacks {
        std::function<void(const std::string&)> on_partial;
        // Receives the accumulated final transcript so far.
        std::function<void(const std::string&)> on_final;
        std::function<void(const Error&)> on_error;
    };

    StreamingSession(Executor& executor, WsConnector& connector, StreamingConfig config = {});
    ~StreamingSession();

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    void set_token_refresher(TokenRefresher refresher);
    void set_callbacks(Callbacks callbacks);

    // Empty token means: use the cached credential or ask the refresher.
    std::future<Result<void>> warmup(std::string token, StreamingOptions options);
    std::future<Result<void>> connect(StreamingOptions options, std::string token = {});
    void send_audio(std::vector<uint8_t> pcm);
    void finalize();
    std::future<std::string> disconnect(bool close_gracefully = true);
    std::future<void> shutdown();
    std::future<SessionStatus> status();

private:
    using VoidPromise = std::shared_ptr<std::promise<Result<void>>>;

    struct Socket {
        uint64_t id = 0;
        std::shared_ptr<WsConnection> conn;
        StreamingOptions options;
        std::string token;
        bool open = false;
        std::string session_id;

        explicit operator bool() const { return conn != nullptr; }
    };

    enum class Role { None, Warm, Active };

    // Warm path
    void do_warmup(std::string token, StreamingOptions options, VoidPromise promise);
    void start_warm(const std::string& token, const StreamingOptions& options);
    void on_warm_open();
    void on_warm_lost(const Error& err, bool clean_close);
    void discard_warm(const Error& reason);
    void warm_keepalive_tick();
    void schedule_proactive_refresh();
    void proactive_refresh();
    void schedule_rewarm();
    void rewarm();

    // Active path
    void do_connect(StreamingOptions options, std::string token, VoidPromise promise);
    void adopt_warm();
    void open_active(const std::string& token);
    void on_active_open();
    void on_active_lost(const Error& err, bool clean_close);
    void active_keepalive_tick();
    void flush_cold_buffer();
    void on_liveness_timeout();
    void do_send_audio(std::vector<uint8_t> pcm);
    void do_finalize();
    void do_disconnect(bool close_gracefully, std::shared_ptr<std::promise<std::string>> promise);
    void begin_close(bool close_gracefully);
    void finish_disconnect();
    void teardown_active();
    void reset_transcript();

    void handle_message(uint64_t socket_id, const std::string& text);
    void handle_active_message(const ServerMessage& msg);
    void add_result(const ServerMessage& msg);
    void handle_error(uint64_t socket_id, const Error& err);
    void handle_close(uint64_t socket_id, int code, const std::string& reason);

    // Cached credential if still valid, otherwise asks the refresher.
    void acquire_token(std::function<void(Result<std::string>)> done);
    void request_token(std::function<void(Result<std::string>)> done);
    void note_auth_failure(const Error& err);
    WsRequest make_request(const std::string& token, const StreamingOptions& options) const;
    Socket open_socket(const std::string& token, const StreamingOptions& options);
    Role role_of(uint64_t socket_id) const;
    void update_state();
    void do_shutdown();

    static void settle(std::vector<VoidPromise>& waiters, const Result<void>& result);

    template <typename F>
    void post(F&& fn) {
        executor_.post([alive = std::weak_ptr<int>(lifetime_), fn = std::forward<F>(fn)]() mutable {
            if (alive.lock()) fn();
        });
    }

    Executor& executor_;
    WsConnector& connector_;
    StreamingConfig config_;

    TokenRefresher refresher_;
    Callbacks callbacks_;
    CredentialCache credentials_;

    ConnectionState state_ = ConnectionState::Cold;
    uint64_t next_socket_id_ = 1;

    Socket warm_;
    StreamingOptions warm_options_;
    bool has_warm_options_ = false;
    bool warm_token_pending_ = false;
    // Set for warm sockets opened internally (re-warm, rotation); their
    // failures feed the re-warm backoff.
    bool auto_warm_ = false;
    int rewarm_attempts_ = 0;
    std::vector<VoidPromise> warm_waiters_;

    Socket active_;
    StreamingOptions connection_options_;
    bool dictating_ = false;
    bool audio_started_ = false;
    bool finalize_requested_ = false;
    // A graceful disconnect waiting for the liveness check to settle.
    bool close_deferred_ = false;
    std::vector<VoidPromise> connect_waiters_;
    std::vector<std::shared_ptr<std::promise<std::string>>> close_waiters_;

    AudioFrameBuffer cold_buffer_;
    AudioFrameBuffer replay_buffer_;
    bool cold_overflow_logged_ = false;
    bool replay_overflow_logged_ = false;

    std::vector<std::string> final_segments_;
    std::string accumulated_;
    uint64_t results_received_ = 0;
    uint64_t audio_bytes_sent_ = 0;
    uint64_t generation_ = 0;

    TimerSlot warmup_timer_;
    TimerSlot warm_keepalive_timer_;
    TimerSlot refresh_timer_;
    TimerSlot rewarm_timer_;
    TimerSlot connect_timer_;
    TimerSlot active_keepalive_timer_;
    TimerSlot liveness_timer_;
    TimerSlot termination_timer_;

    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};
