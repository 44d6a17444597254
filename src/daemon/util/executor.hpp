#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

// Single-threaded task queue with timers. All tasks posted to one executor run
// sequentially on the same thread, so state they touch needs no locking.
class Executor {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    static constexpr TimerId kNoTimer = 0;

    virtual ~Executor() = default;

    virtual void post(Task task) = 0;

    // Runs `task` once after `delay`. Cancelling an expired or unknown id is a no-op.
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;
    virtual void cancel(TimerId id) = 0;

    virtual Clock::time_point now() const = 0;

    // Runs `task` on the executor thread and waits for it. Runs inline when
    // already on that thread.
    virtual void run_sync(Task task) = 0;
};

// Owns at most one pending timer and cancels it on reset or destruction.
class TimerSlot {
public:
    explicit TimerSlot(Executor& executor) : executor_(executor) {}
    ~TimerSlot() { reset(); }

    TimerSlot(const TimerSlot&) = delete;
    TimerSlot& operator=(const TimerSlot&) = delete;

    void arm(std::chrono::milliseconds delay, Executor::Task task) {
        reset();
        id_ = executor_.schedule(delay, [this, task = std::move(task)] {
            id_ = Executor::kNoTimer;
            task();
        });
    }

    void reset() {
        if (id_ != Executor::kNoTimer) {
            executor_.cancel(id_);
            id_ = Executor::kNoTimer;
        }
    }

    bool armed() const { return id_ != Executor::kNoTimer; }

private:
    Executor& executor_;
    Executor::TimerId id_ = Executor::kNoTimer;
};
