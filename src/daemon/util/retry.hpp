#pragma once

#include "util/error.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>

// Exponential backoff shared by downloads and streaming re-warm.
struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};

    // Delay before retry number `retry` (0-based): base * 2^retry, capped.
    std::chrono::milliseconds delay_for(int retry) const {
        auto delay = base_delay;
        for (int i = 0; i < retry && delay < max_delay; ++i) {
            delay *= 2;
        }
        return std::min(delay, max_delay);
    }

    bool exhausted(int retries_done) const { return retries_done >= max_retries; }
};

// Sleeps for `delay` unless `stop` is requested first. Returns false when stopped.
inline bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

// Runs `op(attempt)` until it succeeds, fails with a non-transient error, or
// the policy is exhausted. `op` receives the 0-based attempt number.
template <typename T>
Result<T> retry_with_backoff(const RetryPolicy& policy,
                             const std::function<Result<T>(int)>& op,
                             std::stop_token stop,
                             std::string_view what = "operation") {
    for (int attempt = 0;; ++attempt) {
        if (attempt > 0) {
            auto delay = policy.delay_for(attempt - 1);
            logging::info("{}: retrying in {}ms (attempt {}/{})", what, delay.count(),
                          attempt + 1, policy.max_retries + 1);
            if (!interruptible_sleep(delay, stop)) {
                return make_error(ErrorCode::Cancelled, std::string(what) + " cancelled");
            }
        }
        if (stop.stop_requested()) {
            return make_error(ErrorCode::Cancelled, std::string(what) + " cancelled");
        }

        auto result = op(attempt);
        if (result) return result;

        if (!is_transient(result.error()) || policy.exhausted(attempt)) {
            return result;
        }
        logging::warn("{}: attempt {} failed: {}", what, attempt + 1, result.error().message);
    }
}
