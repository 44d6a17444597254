#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class ReadStatus {
    Command,        // cmd holds a parsed command
    Incomplete,     // no full line yet
    Malformed,      // a line arrived but was not JSON
    Disconnected,
};

// Newline-delimited JSON command channel. Client descriptors are
// non-blocking and polled by the owner's event loop.
class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    // True when a complete line is already buffered for the client.
    virtual bool pending_command(int client_fd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
