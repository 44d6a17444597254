#pragma once

#include "util/error.hpp"
#include "util/retry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

struct DownloadOptions {
    // (downloaded, total) with total 0 when unknown.
    std::function<void(uint64_t, uint64_t)> on_progress;
    std::chrono::milliseconds progress_interval{100};
    // Used as the total when the server sends no length.
    uint64_t expected_size = 0;
    // Free bytes the destination filesystem must have before any request; 0 skips the check.
    uint64_t required_space = 0;
    std::chrono::milliseconds connect_timeout{60000};
    std::chrono::milliseconds stall_timeout{30000};
    RetryPolicy retry;
};

// Fetches model artifacts to local disk: resumable through a `.tmp`
// sibling, retried on transient failures, renamed into place on success.
class ModelProvisioner {
public:
    static constexpr long kMaxRedirects = 5;
    static constexpr auto kStaleAge = std::chrono::hours(24);

    // Free bytes on the filesystem holding `dir`, or nullopt if unknown.
    using SpaceQuery = std::function<std::optional<uint64_t>(const std::string& dir)>;

    ModelProvisioner();
    explicit ModelProvisioner(SpaceQuery query);

    Result<void> download(const std::string& url, const std::string& dest,
                          const DownloadOptions& options = {}, std::stop_token stop = {});

    // Fails with insufficient_space and the shortfall. Unknown free space passes.
    Result<void> check_disk_space(const std::string& dir, uint64_t required) const;

    // A file smaller than expected minus `tolerance_percent` is deleted and
    // reported as install_failed. Returns the actual size.
    static Result<uint64_t> validate_file_size(const std::string& path, uint64_t expected,
                                               double tolerance_percent = 10.0);

    // Removes `*.tmp` files and `temp-extract-*` directories older than `max_age`.
    static int sweep_stale(const std::string& dir,
                           std::chrono::seconds max_age = kStaleAge);

    static std::optional<uint64_t> statvfs_free_space(const std::string& dir);

private:
    Result<void> attempt(const std::string& url, const std::string& tmp,
                         const DownloadOptions& options, std::stop_token stop);

    SpaceQuery space_query_;
};
