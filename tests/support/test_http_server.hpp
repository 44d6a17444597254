#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

// Loopback HTTP/1.1 server for download and inference tests. Requests are answered one
// connection at a time on a private io thread; every response closes the
// connection. Replies are written raw so tests can truncate or stall them.
class TestHttpServer {
public:
    struct Request {
        std::string method;
        std::string target;
        std::string range;      // value of the Range header, empty if absent
        std::string content_type;
        std::string body;
    };

    struct Reply {
        int status = 200;
        std::string reason = "OK";
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        // Content-Length to advertise; defaults to body.size().
        std::optional<size_t> content_length;
        // Hold the connection open this long after writing the body.
        std::chrono::milliseconds hang{0};
    };

    using Handler = std::function<Reply(const Request&)>;

    explicit TestHttpServer(Handler handler)
        : handler_(std::move(handler)),
          acceptor_(io_, {boost::asio::ip::make_address("127.0.0.1"), 0}) {
        port_ = acceptor_.local_endpoint().port();
        accept();
        thread_ = std::jthread([this] { io_.run(); });
    }

    ~TestHttpServer() {
        io_.stop();
        if (thread_.joinable()) thread_.join();
    }

    TestHttpServer(const TestHttpServer&) = delete;
    TestHttpServer& operator=(const TestHttpServer&) = delete;

    uint16_t port() const { return port_; }

    std::string url(std::string_view path) const {
        return std::format("http://127.0.0.1:{}{}", port_, path);
    }

    std::vector<Request> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    // Serves `content` with Range support, honouring "bytes=N-".
    static Reply ranged(const Request& req, const std::string& content) {
        Reply reply;
        size_t from = 0;
        if (req.range.starts_with("bytes=")) {
            from = std::stoull(req.range.substr(6));
        }
        if (from == 0) {
            reply.body = content;
            return reply;
        }
        if (from >= content.size()) {
            reply.status = 416;
            reply.reason = "Range Not Satisfiable";
            reply.headers.push_back({"Content-Range", std::format("bytes */{}", content.size())});
            return reply;
        }
        reply.status = 206;
        reply.reason = "Partial Content";
        reply.headers.push_back({"Content-Range",
                                 std::format("bytes {}-{}/{}", from, content.size() - 1, content.size())});
        reply.body = content.substr(from);
        return reply;
    }

    static Reply redirect(std::string location) {
        Reply reply;
        reply.status = 302;
        reply.reason = "Found";
        reply.headers.push_back({"Location", std::move(location)});
        return reply;
    }

    static Reply not_found() {
        Reply reply;
        reply.status = 404;
        reply.reason = "Not Found";
        reply.body = "not found";
        return reply;
    }

private:
    void accept() {
        acceptor_.async_accept([this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (ec) return;
            serve(socket);
            accept();
        });
    }

    void serve(boost::asio::ip::tcp::socket& socket) {
        namespace http = boost::beast::http;

        boost::beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(64 * 1024 * 1024);
        boost::system::error_code ec;
        http::read_header(socket, buffer, parser, ec);
        if (ec) return;
        // curl holds back large POST bodies until it sees 100 Continue
        if (parser.get()[http::field::expect] == "100-continue") {
            boost::asio::write(socket, boost::asio::buffer(std::string_view("HTTP/1.1 100 Continue\r\n\r\n")), ec);
            if (ec) return;
        }
        http::read(socket, buffer, parser, ec);
        if (ec) return;
        auto& req = parser.get();

        Request seen{.method = std::string(req.method_string()),
                     .target = std::string(req.target()),
                     .range = {},
                     .content_type = std::string(req[http::field::content_type]),
                     .body = req.body()};
        if (auto it = req.find(http::field::range); it != req.end()) {
            seen.range = std::string(it->value());
        }
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(seen);
        }

        Reply reply = handler_(seen);
        std::string out = std::format("HTTP/1.1 {} {}\r\n", reply.status, reply.reason);
        for (auto& [name, value] : reply.headers) {
            out += std::format("{}: {}\r\n", name, value);
        }
        out += std::format("Content-Length: {}\r\nConnection: close\r\n\r\n",
                           reply.content_length.value_or(reply.body.size()));
        out += reply.body;

        boost::asio::write(socket, boost::asio::buffer(out), ec);
        if (reply.hang.count() > 0) std::this_thread::sleep_for(reply.hang);
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    Handler handler_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;

    mutable std::mutex mutex_;
    std::vector<Request> requests_;

    std::jthread thread_;
};
