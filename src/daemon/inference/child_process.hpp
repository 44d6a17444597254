#pragma once

#include "util/error.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <thread>
#include <vector>

struct ExitStatus {
    bool signaled = false;
    int code = 0;       // exit code, or signal number when signaled

    std::string describe() const;
};

// A spawned helper process with its stdout/stderr drained by a reader
// thread. The child dies with the daemon (PR_SET_PDEATHSIG).
class ChildProcess {
public:
    // Invoked once from the reader thread after the child has been reaped.
    using ExitCallback = std::function<void(pid_t, const ExitStatus&)>;

    static Result<std::unique_ptr<ChildProcess>> spawn(const std::string& binary,
                                                       const std::vector<std::string>& args,
                                                       std::string tag,
                                                       ExitCallback on_exit = {});

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    bool running() const;
    std::optional<ExitStatus> exit_status() const;
    std::chrono::steady_clock::time_point started_at() const { return started_at_; }

    // Searches everything the child has written to stdout and stderr so far.
    bool output_contains(std::string_view needle) const;
    std::string stderr_head(size_t max_chars) const;

    // Blocks until the child exits on its own.
    ExitStatus wait();

    // SIGTERM, wait up to `grace`, then SIGKILL. Returns once reaped.
    ExitStatus terminate(std::chrono::milliseconds grace);

private:
    ChildProcess(pid_t pid, int out_fd, int err_fd, std::string tag, ExitCallback on_exit);

    void reader_loop(std::stop_token stop);
    void append(int fd, const char* data, size_t len);
    bool try_reap();
    bool wait_exit(std::chrono::milliseconds timeout);

    pid_t pid_;
    int out_fd_;
    int err_fd_;
    std::string tag_;
    ExitCallback on_exit_;
    std::chrono::steady_clock::time_point started_at_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<ExitStatus> exit_;
    std::string output_;
    std::string stderr_;

    std::jthread reader_;
};
