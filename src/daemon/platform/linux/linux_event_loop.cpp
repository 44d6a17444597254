#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

DaemonCore::Paths core_paths(const Config& config) {
    auto data = platform::data_dir();
    return {
        .models_dir = config.models_dir(),
        .history_db = (data.empty() ? std::string("/tmp/speechlink") : data) + "/history.db",
    };
}

} // namespace

void LinuxEventLoop::block_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);
}

LinuxEventLoop::LinuxEventLoop(Config config)
    : config_(std::move(config)),
      connector_(executor_.io_context()),
      core_(config_, core_paths(config_), ipc_server_, executor_, connector_,
            // NotifyCallback, called from job threads
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    logging::error("eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    // Jobs may still notify until the core has joined them
    core_.shutdown();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Job notification eventfd; must exist before the core starts any job
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        logging::error("eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        logging::error("signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    logging::info("IPC listening on {}", ipc_path);

    // Core init (history db, cache sweep, prewarm)
    if (!core_.init()) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        logging::error("epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            logging::error("epoll_ctl({}) failed: {}", fd, std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            logging::error("epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
                    logging::info("received signal {}, shutting down", info.ssi_signo);
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                while (::read(worker_event_fd_, &val, sizeof(val)) > 0) {}
                core_.on_jobs_complete();
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    logging::info("shutting down");
    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    do {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case ReadStatus::Incomplete:
                return;
            case ReadStatus::Disconnected:
                drop_client(fd);
                return;
            case ReadStatus::Malformed:
                ipc_server_.send_response(fd, DaemonCore::error_reply(
                    {.code = ErrorCode::InvalidArgument, .message = "malformed JSON command"}));
                continue;
            case ReadStatus::Command:
                break;
        }

        if (!cmd.is_object() || !cmd.contains("cmd") || !cmd["cmd"].is_string()) {
            ipc_server_.send_response(fd, DaemonCore::error_reply(
                {.code = ErrorCode::InvalidArgument, .message = "command must be an object with a \"cmd\" string"}));
            continue;
        }

        auto cmd_str = cmd["cmd"].get<std::string>();
        logging::debug("ipc: {} from client {}", cmd_str, fd);
        auto response = core_.handle_command(fd, cmd_str, cmd);
        if (response && !ipc_server_.send_response(fd, *response)) {
            drop_client(fd);
            return;
        }
    } while (ipc_server_.pending_command(fd));
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    core_.remove_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}
