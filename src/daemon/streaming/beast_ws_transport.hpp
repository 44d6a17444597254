#pragma once

#include "streaming/ws_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <optional>
#include <string>
#include <string_view>

struct WsUrl {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;   // path plus query
};

std::optional<WsUrl> parse_ws_url(std::string_view url);

// WebSocket client on Boost.Beast. Plain ws:// and TLS wss:// are supported;
// all I/O runs on the given io_context.
class BeastWsConnector : public WsConnector {
public:
    explicit BeastWsConnector(boost::asio::io_context& io);

    std::shared_ptr<WsConnection> open(const WsRequest& request, WsHandlers handlers) override;

private:
    boost::asio::io_context& io_;
    boost::asio::ssl::context ssl_ctx_;
};
