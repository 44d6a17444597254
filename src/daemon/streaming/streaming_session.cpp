#include "streaming/streaming_session.hpp"

#include "util/log.hpp"
#include "util/strings.hpp"

#include <format>

using namespace std::chrono_literals;

namespace {

size_t buffer_bytes(std::chrono::milliseconds audio, uint32_t sample_rate) {
    if (sample_rate == 0) sample_rate = kDefaultStreamingSampleRate;
    return static_cast<size_t>(sample_rate) * sizeof(int16_t) * audio.count() / 1000;
}

} // namespace

std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Cold: return "cold";
        case ConnectionState::Warming: return "warming";
        case ConnectionState::WarmIdle: return "warm-idle";
        case ConnectionState::Active: return "active";
        case ConnectionState::Closing: return "closing";
        case ConnectionState::Closed: return "closed";
    }
    return "unknown";
}

StreamingSession::StreamingSession(Executor& executor, WsConnector& connector, StreamingConfig config)
    : executor_(executor), connector_(connector), config_(std::move(config)),
      credentials_(config_.credential_lifetime, config_.credential_margin),
      cold_buffer_(buffer_bytes(config_.buffer_audio, kDefaultStreamingSampleRate)),
      replay_buffer_(buffer_bytes(config_.buffer_audio, kDefaultStreamingSampleRate)),
      warmup_timer_(executor), warm_keepalive_timer_(executor),
      refresh_timer_(executor), rewarm_timer_(executor),
      connect_timer_(executor), active_keepalive_timer_(executor),
      liveness_timer_(executor), termination_timer_(executor) {}

StreamingSession::~StreamingSession() {
    executor_.run_sync([this] {
        do_shutdown();
        lifetime_.reset();
    });
}

void StreamingSession::set_token_refresher(TokenRefresher refresher) {
    executor_.run_sync([this, &refresher] { refresher_ = std::move(refresher); });
}

void StreamingSession::set_callbacks(Callbacks callbacks) {
    executor_.run_sync([this, &callbacks] { callbacks_ = std::move(callbacks); });
}

// Public entry points

std::future<Result<void>> StreamingSession::warmup(std::string token, StreamingOptions options) {
    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto fut = promise->get_future();
    post([this, token = std::move(token), options = std::move(options), promise]() mutable {
        do_warmup(std::move(token), std::move(options), promise);
    });
    return fut;
}

std::future<Result<void>> StreamingSession::connect(StreamingOptions options, std::string token) {
    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto fut = promise->get_future();
    post([this, options = std::move(options), token = std::move(token), promise]() mutable {
        do_connect(std::move(options), std::move(token), promise);
    });
    return fut;
}

void StreamingSession::send_audio(std::vector<uint8_t> pcm) {
    post([this, pcm = std::move(pcm)]() mutable { do_send_audio(std::move(pcm)); });
}

void StreamingSession::finalize() {
    post([this] { do_finalize(); });
}

std::future<std::string> StreamingSession::disconnect(bool close_gracefully) {
    auto promise = std::make_shared<std::promise<std::string>>();
    auto fut = promise->get_future();
    post([this, close_gracefully, promise] { do_disconnect(close_gracefully, promise); });
    return fut;
}

std::future<void> StreamingSession::shutdown() {
    auto promise = std::make_shared<std::promise<void>>();
    auto fut = promise->get_future();
    post([this, promise] {
        do_shutdown();
        promise->set_value();
    });
    return fut;
}

std::future<SessionStatus> StreamingSession::status() {
    auto promise = std::make_shared<std::promise<SessionStatus>>();
    auto fut = promise->get_future();
    post([this, promise] {
        promise->set_value(SessionStatus{
            .state = state_,
            .connected = active_ && active_.open,
            .warm = warm_ && warm_.open,
            .credential_valid = credentials_.valid(executor_.now()),
            .session_id = active_ ? active_.session_id : warm_.session_id,
            .rewarm_attempts = rewarm_attempts_,
            .audio_bytes_sent = audio_bytes_sent_,
        });
    });
    return fut;
}

// Warm path

void StreamingSession::do_warmup(std::string token, StreamingOptions options, VoidPromise promise) {
    if (state_ == ConnectionState::Closed) {
        promise->set_value(make_error(ErrorCode::NotReady, "streaming session is shut down"));
        return;
    }
    if (dictating_) {
        promise->set_value(make_error(ErrorCode::NotReady, "cannot warm up during an active dictation"));
        return;
    }

    if ((warm_ || warm_token_pending_) && warm_options_ == options) {
        if (warm_ && warm_.open) {
            logging::debug("streaming: connection already warm");
            promise->set_value({});
        } else {
            logging::debug("streaming: warmup already in progress");
            warm_waiters_.push_back(std::move(promise));
        }
        return;
    }
    if (warm_) discard_warm({.code = ErrorCode::Cancelled, .message = "warm connection replaced"});

    rewarm_attempts_ = 0;
    rewarm_timer_.reset();
    auto_warm_ = false;
    warm_options_ = options;
    has_warm_options_ = true;
    warm_waiters_.push_back(std::move(promise));

    if (!token.empty()) {
        credentials_.store(token, executor_.now());
        start_warm(token, options);
        return;
    }

    warm_token_pending_ = true;
    update_state();
    acquire_token([this, options](Result<std::string> token) {
        if (options != warm_options_) return;
        warm_token_pending_ = false;
        if (!token) {
            settle(warm_waiters_, std::unexpected(token.error()));
            update_state();
            return;
        }
        if (warm_ || dictating_ || state_ == ConnectionState::Closed) {
            settle(warm_waiters_, make_error(ErrorCode::Cancelled, "warmup superseded"));
            return;
        }
        start_warm(*token, options);
    });
}

void StreamingSession::start_warm(const std::string& token, const StreamingOptions& options) {
    logging::debug("streaming: warming up connection");
    warm_ = open_socket(token, options);
    warmup_timer_.arm(config_.connect_timeout, [this] {
        logging::warn("streaming: warmup connection timed out");
        bool retry = auto_warm_;
        discard_warm({.code = ErrorCode::Timeout, .message = "warmup connection timeout"});
        update_state();
        if (retry) schedule_rewarm();
    });
    update_state();
}

void StreamingSession::on_warm_open() {
    warmup_timer_.reset();
    warm_.open = true;
    logging::debug("streaming: warm connection open");

    // Idle timeouts on the server only reset on audio, so send silence right away.
    warm_.conn->send_binary(listen_protocol::silence_frame(warm_.options.sample_rate));
    warm_keepalive_timer_.arm(config_.keepalive_interval, [this] { warm_keepalive_tick(); });
    schedule_proactive_refresh();

    settle(warm_waiters_, {});
    update_state();
}

void StreamingSession::warm_keepalive_tick() {
    if (!warm_ || !warm_.open || !warm_.conn->is_open()) {
        logging::debug("streaming: warm keepalive target gone");
        return;
    }
    warm_.conn->send_binary(listen_protocol::silence_frame(warm_.options.sample_rate));
    warm_keepalive_timer_.arm(config_.keepalive_interval, [this] { warm_keepalive_tick(); });
}

void StreamingSession::on_warm_lost(const Error& err, bool clean_close) {
    bool was_ready = warm_.open;
    bool retry = auto_warm_;

    if (clean_close) {
        logging::debug("streaming: warm {}", err.message);
    } else {
        logging::warn("streaming: warm connection error: {}", err.message);
    }
    note_auth_failure(err);

    warmup_timer_.reset();
    warm_keepalive_timer_.reset();
    refresh_timer_.reset();
    warm_ = {};

    if (!was_ready) {
        settle(warm_waiters_, std::unexpected(err));
        update_state();
        if (retry) schedule_rewarm();
        return;
    }

    update_state();
    schedule_rewarm();
}

void StreamingSession::discard_warm(const Error& reason) {
    warmup_timer_.reset();
    warm_keepalive_timer_.reset();
    refresh_timer_.reset();
    if (warm_.conn) warm_.conn->terminate();
    warm_ = {};
    settle(warm_waiters_, std::unexpected(reason));
}

void StreamingSession::schedule_proactive_refresh() {
    refresh_timer_.reset();
    auto issued = credentials_.issued_at();
    if (!refresher_ || !issued) return;

    auto now = executor_.now();
    auto fire_at = *issued + config_.credential_lifetime - config_.refresh_margin;
    // A token that came back unchanged keeps its old issue time; count from now.
    if (fire_at <= now) fire_at = now + config_.credential_lifetime - config_.refresh_margin;
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(fire_at - now);
    refresh_timer_.arm(delay, [this] { proactive_refresh(); });
}

void StreamingSession::proactive_refresh() {
    if (!warm_ || !warm_.open || dictating_) return;
    logging::debug("streaming: refreshing credential ahead of expiry");

    request_token([this](Result<std::string> token) {
        if (!token) {
            logging::debug("streaming: proactive credential refresh failed: {}", token.error().message);
            return;
        }
        if (!warm_ || !warm_.open || dictating_) return;
        if (*token == warm_.token) {
            logging::debug("streaming: credential unchanged, keeping warm connection");
            schedule_proactive_refresh();
            return;
        }

        logging::debug("streaming: rotating warm connection with fresh credential");
        auto options = warm_.options;
        discard_warm({.code = ErrorCode::Cancelled, .message = "warm connection rotated"});
        auto_warm_ = true;
        start_warm(*token, options);
    });
}

void StreamingSession::schedule_rewarm() {
    if (state_ == ConnectionState::Closed || dictating_ || !has_warm_options_) return;
    if (config_.rewarm.exhausted(rewarm_attempts_)) {
        logging::debug("streaming: max re-warm attempts reached, next dictation will cold-start");
        return;
    }

    auto delay = config_.rewarm.delay_for(rewarm_attempts_);
    ++rewarm_attempts_;
    logging::debug("streaming: re-warm attempt {} in {}ms", rewarm_attempts_, delay.count());
    rewarm_timer_.arm(delay, [this] { rewarm(); });
}

void StreamingSession::rewarm() {
    if (warm_ || warm_token_pending_ || dictating_ || state_ == ConnectionState::Closed) return;

    warm_token_pending_ = true;
    acquire_token([this](Result<std::string> token) {
        warm_token_pending_ = false;
        if (warm_ || dictating_ || state_ == ConnectionState::Closed) return;
        if (!token) {
            logging::debug("streaming: cannot re-warm: {}", token.error().message);
            update_state();
            schedule_rewarm();
            return;
        }
        auto_warm_ = true;
        start_warm(*token, warm_options_);
    });
}

// Active path

void StreamingSession::do_connect(StreamingOptions options, std::string token, VoidPromise promise) {
    if (state_ == ConnectionState::Closed) {
        promise->set_value(make_error(ErrorCode::NotReady, "streaming session is shut down"));
        return;
    }
    if (!close_waiters_.empty()) {
        finish_disconnect();
    }
    if (dictating_) {
        if (active_ && active_.open) {
            logging::debug("streaming: already connected");
            promise->set_value({});
        } else {
            connect_waiters_.push_back(std::move(promise));
        }
        return;
    }

    dictating_ = true;
    audio_started_ = false;
    finalize_requested_ = false;
    cold_overflow_logged_ = false;
    replay_overflow_logged_ = false;
    connection_options_ = options;
    reset_transcript();
    results_received_ = 0;
    audio_bytes_sent_ = 0;
    cold_buffer_ = AudioFrameBuffer(buffer_bytes(config_.buffer_audio, options.sample_rate));
    replay_buffer_ = AudioFrameBuffer(buffer_bytes(config_.buffer_audio, options.sample_rate));
    rewarm_timer_.reset();

    if (warm_ && warm_.open && warm_.conn->is_open() && warm_.options == options) {
        adopt_warm();
        promise->set_value({});
        return;
    }

    if (warm_) {
        logging::debug("streaming: discarding warm connection ({})",
                       warm_.open ? "options differ" : "still connecting");
        discard_warm({.code = ErrorCode::Cancelled, .message = "warm connection superseded by connect"});
    }

    connect_waiters_.push_back(std::move(promise));

    if (!token.empty()) {
        credentials_.store(token, executor_.now());
        open_active(token);
        return;
    }

    update_state();
    auto gen = generation_;
    acquire_token([this, gen](Result<std::string> token) {
        if (gen != generation_ || !dictating_) return;
        if (!token) {
            dictating_ = false;
            cold_buffer_.clear();
            settle(connect_waiters_, std::unexpected(token.error()));
            update_state();
            return;
        }
        open_active(*token);
    });
}

void StreamingSession::adopt_warm() {
    warmup_timer_.reset();
    warm_keepalive_timer_.reset();
    refresh_timer_.reset();

    active_ = std::move(warm_);
    warm_ = {};
    rewarm_attempts_ = 0;
    logging::debug("streaming: using pre-warmed connection");

    active_keepalive_timer_.arm(config_.keepalive_interval, [this] { active_keepalive_tick(); });
    liveness_timer_.arm(config_.liveness_timeout, [this] { on_liveness_timeout(); });
    update_state();
}

void StreamingSession::open_active(const std::string& token) {
    logging::debug("streaming: connecting (cold start)");
    active_ = open_socket(token, connection_options_);
    connect_timer_.arm(config_.connect_timeout, [this] {
        on_active_lost({.code = ErrorCode::Timeout, .message = "streaming connection timeout"}, false);
    });
    update_state();
}

void StreamingSession::on_active_open() {
    connect_timer_.reset();
    active_.open = true;
    logging::debug("streaming: connected");

    flush_cold_buffer();
    if (finalize_requested_) {
        // Asked for before this socket opened, or sent to the one it replaced
        active_.conn->send_text(listen_protocol::finalize_message());
    }
    if (!audio_started_) {
        active_keepalive_timer_.arm(config_.keepalive_interval, [this] { active_keepalive_tick(); });
    }

    settle(connect_waiters_, {});
    if (close_deferred_) {
        begin_close(true);
        return;
    }
    update_state();
}

void StreamingSession::active_keepalive_tick() {
    if (!active_ || !active_.open || audio_started_) return;
    active_.conn->send_text(listen_protocol::keepalive_message());
    active_keepalive_timer_.arm(config_.keepalive_interval, [this] { active_keepalive_tick(); });
}

void StreamingSession::flush_cold_buffer() {
    if (cold_buffer_.empty()) return;
    logging::debug("streaming: flushing {} buffered chunks ({} bytes)",
                   cold_buffer_.size(), cold_buffer_.bytes());

    audio_started_ = true;
    active_keepalive_timer_.reset();
    for (auto& chunk : cold_buffer_.take()) {
        audio_bytes_sent_ += chunk.size();
        active_.conn->send_binary(std::move(chunk));
    }
}

void StreamingSession::do_send_audio(std::vector<uint8_t> pcm) {
    if (!dictating_ || close_deferred_ || pcm.empty()) return;

    if (!active_ || !active_.open) {
        if (!cold_buffer_.push(pcm) && !cold_overflow_logged_) {
            logging::warn("streaming: cold-start buffer full, dropping audio");
            cold_overflow_logged_ = true;
        }
        return;
    }

    if (!audio_started_) {
        audio_started_ = true;
        active_keepalive_timer_.reset();
    }
    flush_cold_buffer();

    if (liveness_timer_.armed() && !replay_buffer_.push(pcm) && !replay_overflow_logged_) {
        logging::warn("streaming: replay buffer full, later audio cannot be replayed");
        replay_overflow_logged_ = true;
    }
    audio_bytes_sent_ += pcm.size();
    active_.conn->send_binary(std::move(pcm));
}

void StreamingSession::on_liveness_timeout() {
    if (results_received_ > 0 || !active_ || !active_.open) return;

    logging::warn("streaming: warm connection unresponsive ({} bytes sent), reconnecting",
                  audio_bytes_sent_);

    auto gen = generation_;
    auto replay = replay_buffer_.take();
    teardown_active();
    cold_buffer_.prepend(std::move(replay));
    if (close_deferred_) {
        termination_timer_.arm(config_.connect_timeout, [this] {
            logging::debug("streaming: reconnect did not finish before close, using accumulated text");
            finish_disconnect();
        });
    }
    update_state();

    acquire_token([this, gen](Result<std::string> token) {
        if (gen != generation_ || !dictating_) return;
        if (!token) {
            logging::error("streaming: reconnect failed: {}", token.error().message);
            if (callbacks_.on_error) callbacks_.on_error(token.error());
            if (close_deferred_) {
                finish_disconnect();
                return;
            }
            dictating_ = false;
            cold_buffer_.clear();
            update_state();
            return;
        }
        open_active(*token);
    });
}

void StreamingSession::on_active_lost(const Error& err, bool clean_close) {
    if (!close_waiters_.empty()) {
        logging::debug("streaming: server closed the stream");
        finish_disconnect();
        return;
    }

    bool was_open = active_.open;
    if (clean_close) {
        logging::warn("streaming: {}", err.message);
    } else {
        logging::error("streaming: {}", err.message);
    }
    note_auth_failure(err);

    teardown_active();
    dictating_ = false;
    cold_buffer_.clear();
    update_state();

    if (!was_open && !connect_waiters_.empty()) {
        settle(connect_waiters_, std::unexpected(err));
        return;
    }
    if (callbacks_.on_error) callbacks_.on_error(err);
}

void StreamingSession::do_finalize() {
    if (!dictating_) return;
    finalize_requested_ = true;
    if (!active_ || !active_.open) return;
    active_.conn->send_text(listen_protocol::finalize_message());
    logging::debug("streaming: finalize sent");
}

void StreamingSession::do_disconnect(bool close_gracefully,
                                     std::shared_ptr<std::promise<std::string>> promise) {
    logging::debug("streaming: disconnect ({} bytes sent, {} results, {} chars)",
                   audio_bytes_sent_, results_received_, accumulated_.size());

    bool already_closing = !close_waiters_.empty();
    close_waiters_.push_back(std::move(promise));
    if (already_closing) return;

    // An adopted socket that has not answered yet may be dead. Closing now
    // would lose the audio, so wait for results or the liveness reconnect.
    if (close_gracefully && dictating_ && liveness_timer_.armed() && results_received_ == 0) {
        logging::debug("streaming: disconnect waits for the liveness check");
        close_deferred_ = true;
        termination_timer_.arm(config_.liveness_timeout + config_.termination_timeout, [this] {
            logging::debug("streaming: close timeout, using accumulated text");
            finish_disconnect();
        });
        update_state();
        return;
    }
    begin_close(close_gracefully);
}

void StreamingSession::begin_close(bool close_gracefully) {
    ++generation_;
    close_deferred_ = false;
    dictating_ = false;
    liveness_timer_.reset();
    termination_timer_.reset();
    cold_buffer_.clear();
    settle(connect_waiters_, make_error(ErrorCode::Cancelled, "disconnected before the connection opened"));

    if (close_gracefully && active_ && active_.open && active_.conn->is_open()) {
        active_keepalive_timer_.reset();
        active_.conn->send_text(listen_protocol::close_stream_message());
        termination_timer_.arm(config_.termination_timeout, [this] {
            logging::debug("streaming: close timeout, using accumulated text");
            finish_disconnect();
        });
        update_state();
        return;
    }
    finish_disconnect();
}

void StreamingSession::finish_disconnect() {
    ++generation_;
    close_deferred_ = false;
    dictating_ = false;
    cold_buffer_.clear();
    settle(connect_waiters_, make_error(ErrorCode::Cancelled, "disconnected before the connection opened"));

    auto text = accumulated_;
    teardown_active();
    reset_transcript();

    auto waiters = std::exchange(close_waiters_, {});
    update_state();
    for (auto& w : waiters) {
        w->set_value(text);
    }
}

void StreamingSession::teardown_active() {
    connect_timer_.reset();
    active_keepalive_timer_.reset();
    liveness_timer_.reset();
    termination_timer_.reset();
    replay_buffer_.clear();
    if (active_.conn) active_.conn->terminate();
    active_ = {};
}

void StreamingSession::reset_transcript() {
    final_segments_.clear();
    accumulated_.clear();
}

// Socket events

void StreamingSession::handle_message(uint64_t socket_id, const std::string& text) {
    auto role = role_of(socket_id);
    if (role == Role::None) return;

    auto msg = listen_protocol::parse_server_message(text);
    if (!msg) {
        logging::warn("streaming: {}", msg.error().message);
        return;
    }

    if (role == Role::Warm) {
        if (msg->type == ServerMessageType::Metadata) {
            warm_.session_id = msg->request_id;
        } else if (msg->type == ServerMessageType::Error) {
            logging::error("streaming: warm connection server error: {}", msg->description);
            if (listen_protocol::is_auth_failure(msg->description)) credentials_.invalidate();
        }
        return;
    }
    handle_active_message(*msg);
}

void StreamingSession::handle_active_message(const ServerMessage& msg) {
    switch (msg.type) {
        case ServerMessageType::Metadata:
            active_.session_id = msg.request_id;
            logging::debug("streaming: session {}", msg.request_id);
            break;

        case ServerMessageType::Results:
            ++results_received_;
            if (liveness_timer_.armed()) {
                liveness_timer_.reset();
                replay_buffer_.clear();
            }
            add_result(msg);
            if (close_deferred_) {
                logging::debug("streaming: connection answered, closing");
                begin_close(true);
            }
            break;

        case ServerMessageType::SpeechStarted:
            logging::debug("streaming: speech started");
            break;

        case ServerMessageType::UtteranceEnd:
            logging::debug("streaming: utterance end");
            break;

        case ServerMessageType::Error: {
            auto desc = msg.description.empty() ? std::string("unknown server error") : msg.description;
            Error err{.code = listen_protocol::is_auth_failure(desc) ? ErrorCode::Authentication
                                                                    : ErrorCode::Protocol,
                      .message = "server error: " + desc};
            logging::error("streaming: {}", err.message);
            note_auth_failure(err);
            if (callbacks_.on_error) callbacks_.on_error(err);
            break;
        }

        case ServerMessageType::Unknown:
            logging::debug("streaming: ignoring message type '{}'", msg.type_name);
            break;
    }
}

void StreamingSession::add_result(const ServerMessage& msg) {
    if (msg.transcript.empty()) return;

    if (!msg.final_result()) {
        if (callbacks_.on_partial) callbacks_.on_partial(msg.transcript);
        return;
    }
    auto segment = trim(msg.transcript);
    if (segment.empty()) return;
    final_segments_.push_back(segment);
    accumulated_ = final_segments_.front();
    for (size_t i = 1; i < final_segments_.size(); ++i) {
        accumulated_ += " " + final_segments_[i];
    }
    if (callbacks_.on_final) callbacks_.on_final(accumulated_);
}

void StreamingSession::handle_error(uint64_t socket_id, const Error& err) {
    switch (role_of(socket_id)) {
        case Role::Warm: on_warm_lost(err, false); break;
        case Role::Active: on_active_lost(err, false); break;
        case Role::None: break;
    }
}

void StreamingSession::handle_close(uint64_t socket_id, int code, const std::string& reason) {
    auto role = role_of(socket_id);
    if (role == Role::None) return;

    Error err{.code = ErrorCode::ConnectionFailed,
              .message = reason.empty() ? std::format("connection closed (code: {})", code)
                                        : std::format("connection closed (code: {}, {})", code, reason)};
    if (role == Role::Warm) {
        on_warm_lost(err, true);
    } else {
        on_active_lost(err, true);
    }
}

// Helpers

void StreamingSession::acquire_token(std::function<void(Result<std::string>)> done) {
    if (auto token = credentials_.get(executor_.now())) {
        done(*token);
        return;
    }
    request_token(std::move(done));
}

void StreamingSession::request_token(std::function<void(Result<std::string>)> done) {
    if (!refresher_) {
        done(make_error(ErrorCode::Authentication, "no valid streaming credential"));
        return;
    }
    auto alive = std::weak_ptr<int>(lifetime_);
    refresher_([this, alive, done = std::move(done)](Result<std::string> token) {
        executor_.post([this, alive, done, token = std::move(token)]() mutable {
            if (!alive.lock()) return;
            if (token && token->empty()) {
                token = make_error(ErrorCode::Authentication, "token refresher returned an empty token");
            }
            if (token) credentials_.store(*token, executor_.now());
            done(std::move(token));
        });
    });
}

void StreamingSession::note_auth_failure(const Error& err) {
    if (err.code == ErrorCode::Authentication || listen_protocol::is_auth_failure(err.message)) {
        logging::debug("streaming: authentication rejected, dropping cached credential");
        credentials_.invalidate();
    }
}

WsRequest StreamingSession::make_request(const std::string& token, const StreamingOptions& options) const {
    return WsRequest{
        .url = listen_protocol::build_url(config_.url, options),
        .headers = {{"Authorization", "Bearer " + token}},
    };
}

StreamingSession::Socket StreamingSession::open_socket(const std::string& token,
                                                       const StreamingOptions& options) {
    Socket s;
    s.id = next_socket_id_++;
    s.options = options;
    s.token = token;

    uint64_t id = s.id;
    auto alive = std::weak_ptr<int>(lifetime_);
    WsHandlers handlers{
        .on_open = [this, alive, id] {
            if (!alive.lock()) return;
            switch (role_of(id)) {
                case Role::Warm: on_warm_open(); break;
                case Role::Active: on_active_open(); break;
                case Role::None: break;
            }
        },
        .on_text = [this, alive, id](std::string text) {
            if (alive.lock()) handle_message(id, text);
        },
        .on_error = [this, alive, id](const Error& err) {
            if (alive.lock()) handle_error(id, err);
        },
        .on_close = [this, alive, id](int code, std::string reason) {
            if (alive.lock()) handle_close(id, code, reason);
        },
    };
    s.conn = connector_.open(make_request(token, options), std::move(handlers));
    return s;
}

StreamingSession::Role StreamingSession::role_of(uint64_t socket_id) const {
    if (warm_ && warm_.id == socket_id) return Role::Warm;
    if (active_ && active_.id == socket_id) return Role::Active;
    return Role::None;
}

void StreamingSession::update_state() {
    if (state_ == ConnectionState::Closed) return;

    ConnectionState next;
    if (!close_waiters_.empty()) {
        next = ConnectionState::Closing;
    } else if (dictating_) {
        next = (active_ && active_.open) ? ConnectionState::Active : ConnectionState::Cold;
    } else if (warm_) {
        next = warm_.open ? ConnectionState::WarmIdle : ConnectionState::Warming;
    } else if (warm_token_pending_) {
        next = ConnectionState::Warming;
    } else {
        next = ConnectionState::Cold;
    }

    if (next != state_) {
        logging::debug("streaming: {} -> {}", to_string(state_), to_string(next));
        state_ = next;
    }
}

void StreamingSession::do_shutdown() {
    if (state_ == ConnectionState::Closed) return;
    ++generation_;
    dictating_ = false;
    has_warm_options_ = false;
    warm_token_pending_ = false;
    rewarm_timer_.reset();

    discard_warm({.code = ErrorCode::Cancelled, .message = "streaming session shut down"});
    settle(connect_waiters_, make_error(ErrorCode::Cancelled, "streaming session shut down"));

    auto text = accumulated_;
    teardown_active();
    reset_transcript();
    cold_buffer_.clear();
    credentials_.invalidate();

    for (auto& w : std::exchange(close_waiters_, {})) {
        w->set_value(text);
    }
    state_ = ConnectionState::Closed;
    logging::debug("streaming: session shut down");
}

void StreamingSession::settle(std::vector<VoidPromise>& waiters, const Result<void>& result) {
    for (auto& w : std::exchange(waiters, {})) {
        w->set_value(result);
    }
}
