#pragma once

#include "util/executor.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <utility>

// Single-threaded executor with virtual time. Nothing runs until the test
// calls run_pending() or advance().
class ManualExecutor : public Executor {
public:
    void post(Task task) override { queue_.push_back(std::move(task)); }

    TimerId schedule(std::chrono::milliseconds delay, Task task) override {
        TimerId id = next_id_++;
        timers_.emplace(id, Timer{.due = now_ + delay, .task = std::move(task)});
        return id;
    }

    void cancel(TimerId id) override { timers_.erase(id); }

    Clock::time_point now() const override { return now_; }

    void run_sync(Task task) override { task(); }

    // Runs queued tasks, including ones they post, until the queue is empty.
    void run_pending() {
        while (!queue_.empty()) {
            auto task = std::move(queue_.front());
            queue_.pop_front();
            task();
        }
    }

    // Moves virtual time forward, firing due timers in deadline order.
    void advance(std::chrono::milliseconds delta) {
        auto target = now_ + delta;
        run_pending();
        while (true) {
            auto next = next_due(target);
            if (next == timers_.end()) break;
            now_ = next->second.due;
            auto task = std::move(next->second.task);
            timers_.erase(next);
            task();
            run_pending();
        }
        now_ = target;
        run_pending();
    }

    size_t pending_timers() const { return timers_.size(); }

private:
    struct Timer {
        Clock::time_point due;
        Task task;
    };

    std::map<TimerId, Timer>::iterator next_due(Clock::time_point limit) {
        auto best = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due > limit) continue;
            if (best == timers_.end() || it->second.due < best->second.due) best = it;
        }
        return best;
    }

    Clock::time_point now_{std::chrono::hours(1)};
    std::deque<Task> queue_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
};
