#include "inference/child_process.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr size_t kMaxOutput = 64 * 1024;
constexpr size_t kMaxStderr = 16 * 1024;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::string ExitStatus::describe() const {
    if (signaled) return "killed by signal " + std::to_string(code);
    return "exit code: " + std::to_string(code);
}

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const std::string& binary,
                                                          const std::vector<std::string>& args,
                                                          std::string tag,
                                                          ExitCallback on_exit) {
    // argv must be built before fork; the child may only call async-signal-safe functions.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(binary.c_str()));
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int out_pipe[2], err_pipe[2], exec_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return make_error(ErrorCode::ProcessFailed, std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return make_error(ErrorCode::ProcessFailed, std::string("pipe() failed: ") + std::strerror(saved));
    }
    if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return make_error(ErrorCode::ProcessFailed, std::string("pipe() failed: ") + std::strerror(saved));
    }

    pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            ::close(fd);
        }
        return make_error(ErrorCode::ProcessFailed, std::string("fork() failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: die with the daemon, undo the daemon's blocked signal mask
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (::getppid() != parent) ::_exit(127);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execv(binary.c_str(), argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    // The exec pipe closes on successful exec; otherwise it carries errno.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        return make_error(ErrorCode::ProcessFailed,
                          "exec " + binary + " failed: " + std::strerror(exec_errno));
    }

    logging::debug("{}: spawned pid {} ({})", tag, pid, binary);
    return std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, out_pipe[0], err_pipe[0], std::move(tag), std::move(on_exit)));
}

ChildProcess::ChildProcess(pid_t pid, int out_fd, int err_fd, std::string tag, ExitCallback on_exit)
    : pid_(pid), out_fd_(out_fd), err_fd_(err_fd), tag_(std::move(tag)),
      on_exit_(std::move(on_exit)), started_at_(std::chrono::steady_clock::now()) {
    reader_ = std::jthread([this](std::stop_token st) { reader_loop(st); });
}

ChildProcess::~ChildProcess() {
    if (running()) terminate(std::chrono::milliseconds(5000));
    reader_.request_stop();
    if (reader_.joinable()) reader_.join();
    close_fd(out_fd_);
    close_fd(err_fd_);
}

bool ChildProcess::running() const {
    std::lock_guard lock(mutex_);
    return !exit_.has_value();
}

std::optional<ExitStatus> ChildProcess::exit_status() const {
    std::lock_guard lock(mutex_);
    return exit_;
}

bool ChildProcess::output_contains(std::string_view needle) const {
    std::lock_guard lock(mutex_);
    return output_.find(needle) != std::string::npos;
}

std::string ChildProcess::stderr_head(size_t max_chars) const {
    std::lock_guard lock(mutex_);
    return stderr_.substr(0, max_chars);
}

void ChildProcess::append(int fd, const char* data, size_t len) {
    std::string_view chunk(data, len);
    {
        std::lock_guard lock(mutex_);
        if (output_.size() < kMaxOutput) {
            output_.append(chunk.substr(0, kMaxOutput - output_.size()));
        }
        if (fd == err_fd_ && stderr_.size() < kMaxStderr) {
            stderr_.append(chunk.substr(0, kMaxStderr - stderr_.size()));
        }
    }
    if (logging::verbose()) {
        while (!chunk.empty() && (chunk.back() == '\n' || chunk.back() == '\r')) chunk.remove_suffix(1);
        if (!chunk.empty()) {
            logging::debug("{} {}: {}", tag_, fd == err_fd_ ? "stderr" : "stdout", chunk);
        }
    }
}

bool ChildProcess::try_reap() {
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r != pid_) return false;

    ExitStatus st;
    if (WIFSIGNALED(status)) {
        st.signaled = true;
        st.code = WTERMSIG(status);
    } else {
        st.code = WEXITSTATUS(status);
    }
    {
        std::lock_guard lock(mutex_);
        exit_ = st;
    }
    cv_.notify_all();
    logging::debug("{}: pid {} exited ({})", tag_, pid_, st.describe());
    if (on_exit_) on_exit_(pid_, st);
    return true;
}

void ChildProcess::reader_loop(std::stop_token stop) {
    char buf[4096];
    bool reaped = false;
    while (!stop.stop_requested()) {
        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd_ >= 0) fds[count++] = {.fd = out_fd_, .events = POLLIN, .revents = 0};
        if (err_fd_ >= 0) fds[count++] = {.fd = err_fd_, .events = POLLIN, .revents = 0};

        int ready = 0;
        if (count > 0) {
            ready = ::poll(fds, count, 100);
            if (ready < 0 && errno != EINTR) {
                logging::warn("{}: poll failed: {}", tag_, std::strerror(errno));
                close_fd(out_fd_);
                close_fd(err_fd_);
                count = 0;
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        for (nfds_t i = 0; ready > 0 && i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                append(fds[i].fd, buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                int& fd = fds[i].fd == out_fd_ ? out_fd_ : err_fd_;
                close_fd(fd);
            }
        }

        if (!reaped) reaped = try_reap();
        // Grandchildren may keep the pipes open; stop once reaped and quiet.
        if (reaped && (count == 0 || ready == 0)) break;
    }
}

bool ChildProcess::wait_exit(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return exit_.has_value(); });
}

ExitStatus ChildProcess::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return exit_.has_value(); });
    return *exit_;
}

ExitStatus ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (running()) {
        ::kill(pid_, SIGTERM);
        if (!wait_exit(grace)) {
            logging::warn("{}: pid {} ignored SIGTERM, sending SIGKILL", tag_, pid_);
            ::kill(pid_, SIGKILL);
            while (!wait_exit(std::chrono::milliseconds(1000))) {}
        }
    }
    std::lock_guard lock(mutex_);
    return *exit_;
}
