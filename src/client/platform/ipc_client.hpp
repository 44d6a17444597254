#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Client side of the newline-delimited JSON command channel.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // A negative timeout waits indefinitely.
    virtual bool recv(nlohmann::json& response, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
    // Why the last failed call failed.
    virtual const std::string& last_error() const = 0;
};
