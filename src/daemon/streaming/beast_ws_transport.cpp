#include "streaming/beast_ws_transport.hpp"

#include "util/http_client.hpp"
#include "util/log.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <deque>
#include <format>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(30);

Error classify(const beast::error_code& ec, std::string_view what) {
    auto msg = std::format("websocket {}: {}", what, ec.message());
    if (ec == beast::error::timeout || ec == net::error::timed_out) {
        return {.code = ErrorCode::Timeout, .message = std::move(msg)};
    }
    if (ec == net::error::host_not_found || ec == net::error::host_not_found_try_again ||
        ec == net::error::no_data) {
        return {.code = ErrorCode::DnsFailure, .message = std::move(msg)};
    }
    if (ec == net::error::eof || ec == http::error::end_of_stream ||
        ec == ssl::error::stream_truncated) {
        return {.code = ErrorCode::PrematureClose, .message = std::move(msg)};
    }
    return {.code = ErrorCode::ConnectionFailed, .message = std::move(msg)};
}

template <typename NextLayer>
class BeastWsConnection
    : public WsConnection,
      public std::enable_shared_from_this<BeastWsConnection<NextLayer>> {
public:
    static constexpr bool kTls = !std::is_same_v<NextLayer, beast::tcp_stream>;

    template <typename... StreamArgs>
    BeastWsConnection(net::io_context& io, WsUrl url, WsRequest request, WsHandlers handlers,
                      StreamArgs&&... stream_args)
        : resolver_(io),
          ws_(std::forward<StreamArgs>(stream_args)...),
          url_(std::move(url)),
          request_(std::move(request)),
          handlers_(std::move(handlers)) {}

    void start() {
        resolver_.async_resolve(url_.host, url_.port,
            beast::bind_front_handler(&BeastWsConnection::on_resolve, this->shared_from_this()));
    }

    bool is_open() const override { return open_ && !close_requested_; }

    void send_binary(std::vector<uint8_t> data) override {
        enqueue(true, std::string(data.begin(), data.end()));
    }

    void send_text(std::string text) override {
        enqueue(false, std::move(text));
    }

    void close() override {
        if (!open_ || terminated_ || close_requested_) return;
        close_requested_ = true;
        if (!writing_) do_close();
    }

    void terminate() override {
        if (terminated_) return;
        terminated_ = true;
        open_ = false;
        handlers_ = {};
        queue_.clear();
        resolver_.cancel();
        beast::get_lowest_layer(ws_).close();
    }

private:
    struct Outgoing {
        bool binary;
        std::string payload;
    };

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (terminated_) return;
        if (ec) return fail(classify(ec, "resolve " + url_.host));

        beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
        beast::get_lowest_layer(ws_).async_connect(results,
            beast::bind_front_handler(&BeastWsConnection::on_connect, this->shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (terminated_) return;
        if (ec) return fail(classify(ec, "connect"));

        if constexpr (kTls) {
            auto& tls = ws_.next_layer();
            if (!SSL_set_tlsext_host_name(tls.native_handle(), url_.host.c_str())) {
                return fail({.code = ErrorCode::ConnectionFailed,
                             .message = "websocket tls: failed to set SNI host name"});
            }
            tls.set_verify_callback(ssl::host_name_verification(url_.host));
            tls.async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&BeastWsConnection::on_tls_handshake, this->shared_from_this()));
        } else {
            upgrade();
        }
    }

    void on_tls_handshake(beast::error_code ec) {
        if (terminated_) return;
        if (ec) return fail(classify(ec, "tls handshake"));
        upgrade();
    }

    void upgrade() {
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator(
            [headers = request_.headers](websocket::request_type& req) {
                req.set(http::field::user_agent, ::http::user_agent());
                for (auto& [name, value] : headers) {
                    req.set(name, value);
                }
            }));

        bool default_port = (kTls && url_.port == "443") || (!kTls && url_.port == "80");
        host_header_ = default_port ? url_.host : url_.host + ":" + url_.port;

        ws_.async_handshake(upgrade_response_, host_header_, url_.target,
            beast::bind_front_handler(&BeastWsConnection::on_handshake, this->shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (terminated_) return;
        if (ec == websocket::error::upgrade_declined) {
            int status = upgrade_response_.result_int();
            auto msg = std::format("websocket handshake rejected: {} {}", status,
                                   std::string(upgrade_response_.reason()));
            if (status == 401 || status == 403) {
                return fail({.code = ErrorCode::Authentication, .message = msg, .http_status = status});
            }
            return fail({.code = ErrorCode::HttpStatus, .message = msg, .http_status = status});
        }
        if (ec) return fail(classify(ec, "handshake"));

        open_ = true;
        if (handlers_.on_open) handlers_.on_open();
        do_read();
    }

    void do_read() {
        if (terminated_ || finished_) return;
        ws_.async_read(buffer_,
            beast::bind_front_handler(&BeastWsConnection::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (terminated_) return;
        if (ec == websocket::error::closed) {
            open_ = false;
            auto reason = ws_.reason();
            return finish(static_cast<int>(reason.code),
                          std::string(reason.reason.data(), reason.reason.size()));
        }
        if (ec) {
            open_ = false;
            return fail(classify(ec, "read"));
        }

        if (ws_.got_text()) {
            auto text = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());
            if (handlers_.on_text) handlers_.on_text(std::move(text));
        } else {
            buffer_.consume(buffer_.size());
        }
        do_read();
    }

    void enqueue(bool binary, std::string payload) {
        if (!open_ || terminated_ || close_requested_) return;
        queue_.push_back({binary, std::move(payload)});
        if (!writing_) do_write();
    }

    void do_write() {
        if (queue_.empty()) {
            writing_ = false;
            if (close_requested_) do_close();
            return;
        }
        writing_ = true;
        ws_.binary(queue_.front().binary);
        ws_.async_write(net::buffer(queue_.front().payload),
            beast::bind_front_handler(&BeastWsConnection::on_write, this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (terminated_) return;
        if (!queue_.empty()) queue_.pop_front();
        if (ec) {
            writing_ = false;
            queue_.clear();
            open_ = false;
            return fail(classify(ec, "write"));
        }
        do_write();
    }

    void do_close() {
        ws_.async_close(websocket::close_code::normal,
            beast::bind_front_handler(&BeastWsConnection::on_close_sent, this->shared_from_this()));
    }

    void on_close_sent(beast::error_code ec) {
        if (terminated_) return;
        // The pending read observes the peer's close frame and reports it.
        if (ec) fail(classify(ec, "close"));
    }

    void fail(const Error& err) {
        if (finished_) return;
        finished_ = true;
        logging::debug("{}", err.message);
        auto handler = std::move(handlers_.on_error);
        handlers_ = {};
        if (handler) handler(err);
    }

    void finish(int code, std::string reason) {
        if (finished_) return;
        finished_ = true;
        auto handler = std::move(handlers_.on_close);
        handlers_ = {};
        if (handler) handler(code, std::move(reason));
    }

    tcp::resolver resolver_;
    websocket::stream<NextLayer> ws_;
    beast::flat_buffer buffer_;
    websocket::response_type upgrade_response_;

    WsUrl url_;
    WsRequest request_;
    WsHandlers handlers_;
    std::string host_header_;

    std::deque<Outgoing> queue_;
    bool open_ = false;
    bool writing_ = false;
    bool close_requested_ = false;
    bool terminated_ = false;
    bool finished_ = false;
};

using PlainConnection = BeastWsConnection<beast::tcp_stream>;
using TlsConnection = BeastWsConnection<beast::ssl_stream<beast::tcp_stream>>;

// Returned when the URL cannot be parsed; reports the failure on the next turn.
class FailedConnection : public WsConnection {
public:
    bool is_open() const override { return false; }
    void send_binary(std::vector<uint8_t>) override {}
    void send_text(std::string) override {}
    void close() override {}
    void terminate() override {}
};

} // namespace

std::optional<WsUrl> parse_ws_url(std::string_view url) {
    WsUrl out;
    std::string_view rest;
    if (url.starts_with("wss://")) {
        out.secure = true;
        rest = url.substr(6);
    } else if (url.starts_with("ws://")) {
        rest = url.substr(5);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, slash);
    if (slash == std::string_view::npos) {
        out.target = "/";
    } else {
        out.target = std::string(rest.substr(slash));
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        out.host = std::string(authority.substr(0, colon));
        out.port = std::string(authority.substr(colon + 1));
    } else {
        out.host = std::string(authority);
        out.port = out.secure ? "443" : "80";
    }
    if (out.host.empty() || out.port.empty()) return std::nullopt;
    return out;
}

BeastWsConnector::BeastWsConnector(net::io_context& io)
    : io_(io), ssl_ctx_(ssl::context::tls_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

std::shared_ptr<WsConnection> BeastWsConnector::open(const WsRequest& request, WsHandlers handlers) {
    auto url = parse_ws_url(request.url);
    if (!url) {
        auto on_error = std::move(handlers.on_error);
        net::post(io_, [on_error = std::move(on_error), u = request.url] {
            if (on_error) on_error({.code = ErrorCode::InvalidArgument, .message = "invalid websocket url: " + u});
        });
        return std::make_shared<FailedConnection>();
    }

    if (url->secure) {
        auto conn = std::make_shared<TlsConnection>(io_, *url, request, std::move(handlers), io_, ssl_ctx_);
        conn->start();
        return conn;
    }
    auto conn = std::make_shared<PlainConnection>(io_, *url, request, std::move(handlers), io_);
    conn->start();
    return conn;
}
