#include "util/log.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace logging {

namespace {
std::atomic<bool> g_verbose{false};
std::mutex g_write_mutex;

std::string_view level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
    }
    return "";
}
} // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void write(Level level, std::string_view msg) {
    std::lock_guard lock(g_write_mutex);
    if (level == Level::Info) {
        std::println(stderr, "[speechlink] {}", msg);
    } else {
        std::println(stderr, "[speechlink] {}: {}", level_tag(level), msg);
    }
}

} // namespace logging
