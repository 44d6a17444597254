#pragma once

#include "util/error.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct WsRequest {
    std::string url;   // ws:// or wss://
    std::vector<std::pair<std::string, std::string>> headers;
};

// Socket events. Handlers run on the executor thread the connector is bound to.
// A connection ends with exactly one of on_close or on_error, and nothing
// fires after terminate().
struct WsHandlers {
    std::function<void()> on_open;
    std::function<void(std::string)> on_text;
    std::function<void(const Error&)> on_error;
    std::function<void(int code, std::string reason)> on_close;
};

class WsConnection {
public:
    virtual ~WsConnection() = default;
    virtual bool is_open() const = 0;
    virtual void send_binary(std::vector<uint8_t> data) = 0;
    virtual void send_text(std::string text) = 0;
    // Graceful close handshake; on_close fires when the peer acknowledges.
    virtual void close() = 0;
    // Drops the socket without notifying handlers.
    virtual void terminate() = 0;
};

class WsConnector {
public:
    virtual ~WsConnector() = default;
    virtual std::shared_ptr<WsConnection> open(const WsRequest& request, WsHandlers handlers) = 0;
};
