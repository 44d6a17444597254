#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "streaming/beast_ws_transport.hpp"
#include "util/asio_executor.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    // Must run before any thread exists so every thread inherits the mask;
    // SIGINT and SIGTERM are then only seen through the signalfd.
    static void block_signals();

    explicit LinuxEventLoop(Config config);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);

    Config config_;

    // Platform implementations (constructed before core_)
    AsioExecutor executor_;
    BeastWsConnector connector_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
