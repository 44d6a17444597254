#include "util/asio_executor.hpp"

#include "util/log.hpp"

#include <boost/asio/post.hpp>
#include <exception>
#include <future>

namespace net = boost::asio;

AsioExecutor::AsioExecutor()
    : work_(net::make_work_guard(io_)) {
    thread_ = std::jthread([this] {
        thread_id_.store(std::this_thread::get_id());
        while (true) {
            try {
                io_.run();
                break;
            } catch (const std::exception& e) {
                logging::error("executor: task threw: {}", e.what());
            }
        }
    });
}

AsioExecutor::~AsioExecutor() {
    stop();
}

void AsioExecutor::stop() {
    work_.reset();
    io_.stop();
    if (thread_.joinable() && !in_executor_thread()) {
        thread_.join();
    }
}

bool AsioExecutor::in_executor_thread() const {
    return thread_id_.load() == std::this_thread::get_id();
}

void AsioExecutor::post(Task task) {
    net::post(io_, std::move(task));
}

Executor::TimerId AsioExecutor::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id = next_timer_id_.fetch_add(1);
    if (in_executor_thread()) {
        arm_timer(id, delay, std::move(task));
    } else {
        net::post(io_, [this, id, delay, task = std::move(task)]() mutable {
            arm_timer(id, delay, std::move(task));
        });
    }
    return id;
}

void AsioExecutor::arm_timer(TimerId id, std::chrono::milliseconds delay, Task task) {
    auto timer = std::make_unique<net::steady_timer>(io_, delay);
    timer->async_wait([this, id, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) return;
        if (timers_.erase(id) == 0) return;
        task();
    });
    timers_.emplace(id, std::move(timer));
}

void AsioExecutor::cancel(TimerId id) {
    if (id == kNoTimer) return;
    auto do_cancel = [this, id] {
        auto it = timers_.find(id);
        if (it == timers_.end()) return;
        it->second->cancel();
        timers_.erase(it);
    };
    if (in_executor_thread()) {
        do_cancel();
    } else {
        net::post(io_, std::move(do_cancel));
    }
}

void AsioExecutor::run_sync(Task task) {
    if (in_executor_thread() || io_.stopped()) {
        task();
        return;
    }
    std::promise<void> done;
    auto fut = done.get_future();
    net::post(io_, [&task, &done] {
        task();
        done.set_value();
    });
    fut.wait();
}
