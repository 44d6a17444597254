#pragma once

#include "util/executor.hpp"

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <unordered_map>

// Executor backed by a Boost.Asio io_context running on its own thread.
// Network transports bound to io_context() share the same thread.
class AsioExecutor : public Executor {
public:
    AsioExecutor();
    ~AsioExecutor() override;

    AsioExecutor(const AsioExecutor&) = delete;
    AsioExecutor& operator=(const AsioExecutor&) = delete;

    boost::asio::io_context& io_context() { return io_; }

    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;
    Clock::time_point now() const override { return Clock::now(); }
    void run_sync(Task task) override;

    void stop();

private:
    bool in_executor_thread() const;
    void arm_timer(TimerId id, std::chrono::milliseconds delay, Task task);

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;

    // Touched only on the io thread.
    std::unordered_map<TimerId, std::unique_ptr<boost::asio::steady_timer>> timers_;

    std::atomic<TimerId> next_timer_id_{1};
    std::atomic<std::thread::id> thread_id_;
    std::jthread thread_;
};
