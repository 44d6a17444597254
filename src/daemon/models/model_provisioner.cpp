#include "models/model_provisioner.hpp"
#include "util/http_client.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <curl/curl.h>
#include <filesystem>
#include <format>
#include <memory>
#include <string_view>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace {

struct Transfer {
    CURL* curl = nullptr;
    FILE* file = nullptr;
    bool opened = false;
    std::string tmp;
    const DownloadOptions* options = nullptr;
    std::stop_token stop;

    uint64_t offset = 0;           // bytes on disk when the attempt began
    uint64_t downloaded = 0;       // bytes on disk now
    uint64_t total = 0;
    uint64_t content_length = 0;
    uint64_t range_total = 0;
    std::optional<Error> failure;
    std::chrono::steady_clock::time_point last_progress{};
};

bool starts_with_nocase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

uint64_t parse_u64(std::string_view s) {
    uint64_t v = 0;
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    for (; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
        v = v * 10 + static_cast<uint64_t>(s[i] - '0');
    }
    return v;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    std::string_view line(buffer, size * nitems);

    if (starts_with_nocase(line, "http/")) {
        // A new response (redirect hop): forget the previous one's headers
        t->content_length = 0;
        t->range_total = 0;
    } else if (starts_with_nocase(line, "content-length:")) {
        t->content_length = parse_u64(line.substr(15));
    } else if (starts_with_nocase(line, "content-range:")) {
        auto slash = line.rfind('/');
        if (slash != std::string_view::npos) t->range_total = parse_u64(line.substr(slash + 1));
    }
    return size * nitems;
}

void emit_progress(Transfer& t, bool force) {
    if (!t.options->on_progress) return;
    auto now = std::chrono::steady_clock::now();
    if (!force && now - t.last_progress < t.options->progress_interval) return;
    t.last_progress = now;
    t.options->on_progress(t.downloaded, t.total);
}

// Opens the temp file according to the final response's status.
bool open_target(Transfer& t) {
    long status = 0;
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &status);

    if (status == 206) {
        t.file = std::fopen(t.tmp.c_str(), "ab");
        t.downloaded = t.offset;
        t.total = t.range_total ? t.range_total : t.offset + t.content_length;
    } else if (status == 200) {
        if (t.offset > 0) {
            logging::info("download: server ignored range request, restarting from zero");
        }
        t.file = std::fopen(t.tmp.c_str(), "wb");
        t.downloaded = 0;
        t.total = t.content_length;
    } else {
        t.failure = Error{.code = ErrorCode::HttpStatus,
                          .message = std::format("download failed: HTTP {}", status),
                          .http_status = status};
        return false;
    }

    if (!t.file) {
        t.failure = Error{.code = ErrorCode::Io, .message = "cannot open " + t.tmp};
        return false;
    }
    t.opened = true;
    if (t.total == 0 && t.options->expected_size > 0) {
        t.total = t.options->expected_size;
    }
    return true;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t len = size * nmemb;

    if (!t->file && !open_target(*t)) return 0;

    if (std::fwrite(ptr, 1, len, t->file) != len) {
        t->failure = Error{.code = ErrorCode::Io, .message = "write to " + t->tmp + " failed"};
        return 0;
    }
    t->downloaded += len;
    emit_progress(*t, t->total > 0 && t->downloaded >= t->total);
    return len;
}

int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(userdata);
    return t->stop.stop_requested() ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

std::string megabytes(uint64_t bytes) {
    return std::to_string((bytes + 500'000) / 1'000'000) + "MB";
}

} // namespace

ModelProvisioner::ModelProvisioner() : ModelProvisioner(SpaceQuery{}) {}

ModelProvisioner::ModelProvisioner(SpaceQuery query)
    : space_query_(query ? std::move(query) : SpaceQuery(&ModelProvisioner::statvfs_free_space)) {}

Result<void> ModelProvisioner::download(const std::string& url, const std::string& dest,
                                        const DownloadOptions& options, std::stop_token stop) {
    auto dir = fs::path(dest).parent_path();
    if (options.required_space > 0) {
        auto space = check_disk_space(dir.string(), options.required_space);
        if (!space) return space;
    }

    std::error_code ec;
    if (!dir.empty()) fs::create_directories(dir, ec);

    std::string tmp = dest + ".tmp";
    logging::info("download: {} -> {}", url.substr(0, 80), dest);
    if (auto size = fs::file_size(tmp, ec); !ec && size > 0) {
        logging::info("download: resuming at byte {}", size);
    }

    auto result = retry_with_backoff<void>(
        options.retry,
        [&](int) { return attempt(url, tmp, options, stop); },
        stop, "download");

    if (!result) {
        fs::remove(tmp, ec);
        if (result.error().code == ErrorCode::Cancelled) {
            logging::info("download: cancelled {}", dest);
        } else {
            logging::error("download: {} failed: {}", dest, result.error().message);
        }
        return result;
    }

    fs::rename(tmp, dest, ec);
    if (ec == std::errc::cross_device_link) {
        std::error_code copy_ec;
        fs::copy_file(tmp, dest, fs::copy_options::overwrite_existing, copy_ec);
        fs::remove(tmp, ec);
        if (copy_ec) {
            return make_error(ErrorCode::Io, "copy " + tmp + " -> " + dest + ": " + copy_ec.message());
        }
    } else if (ec) {
        auto msg = "rename " + tmp + " -> " + dest + ": " + ec.message();
        fs::remove(tmp, ec);
        return make_error(ErrorCode::Io, msg);
    }

    logging::info("download: complete {}", dest);
    return {};
}

Result<void> ModelProvisioner::attempt(const std::string& url, const std::string& tmp,
                                       const DownloadOptions& options, std::stop_token stop) {
    http::global_init();
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return make_error(ErrorCode::Io, "curl_easy_init failed");

    Transfer t;
    t.curl = curl.get();
    t.tmp = tmp;
    t.options = &options;
    t.stop = stop;

    std::error_code ec;
    if (auto size = fs::file_size(tmp, ec); !ec) t.offset = size;

    auto agent = http::user_agent();
    auto range = std::to_string(t.offset) + "-";
    long stall_s = std::max<long>(1, static_cast<long>(
        std::chrono::duration_cast<std::chrono::seconds>(options.stall_timeout).count()));

    curl_easy_setopt(t.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(t.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(t.curl, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(t.curl, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(t.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(t.curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
    // No data for the stall window: the transfer fails as a timeout
    curl_easy_setopt(t.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(t.curl, CURLOPT_LOW_SPEED_TIME, stall_s);
    if (t.offset > 0) curl_easy_setopt(t.curl, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(t.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(t.curl, CURLOPT_HEADERDATA, &t);
    curl_easy_setopt(t.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(t.curl, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(t.curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(t.curl, CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(t.curl, CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(t.curl);

    bool flush_failed = false;
    if (t.file) {
        flush_failed = std::fclose(t.file) != 0;
        t.file = nullptr;
    }

    if (t.failure) return std::unexpected(*t.failure);
    if (res == CURLE_TOO_MANY_REDIRECTS) {
        return make_error(ErrorCode::HttpStatus, std::format("download failed: more than {} redirects", kMaxRedirects));
    }
    if (res != CURLE_OK) {
        auto err = http::classify(res, "download");
        if (err.code == ErrorCode::Cancelled) err.message = "download cancelled";
        return std::unexpected(err);
    }
    if (flush_failed) return make_error(ErrorCode::Io, "write to " + tmp + " failed");

    // A response without a body never reached the write callback
    if (!t.opened) {
        long status = 0;
        curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &status);
        if (status == 200) {
            if (FILE* f = std::fopen(tmp.c_str(), "wb")) std::fclose(f);
        } else if (status == 206) {
            t.downloaded = t.offset;
        } else {
            return make_error(ErrorCode::HttpStatus, std::format("download failed: HTTP {}", status), status);
        }
    }

    if (t.total > 0 && t.downloaded < t.total) {
        return make_error(ErrorCode::IncompleteTransfer,
                          std::format("download incomplete: received {} of {} bytes", t.downloaded, t.total));
    }

    emit_progress(t, true);
    return {};
}

std::optional<uint64_t> ModelProvisioner::statvfs_free_space(const std::string& dir) {
    std::error_code ec;
    fs::path p = dir.empty() ? fs::path(".") : fs::path(dir);
    // The directory may not exist yet; measure its nearest existing ancestor
    while (!fs::exists(p, ec) && p.has_parent_path() && p != p.parent_path()) {
        p = p.parent_path();
    }

    struct statvfs st{};
    if (::statvfs(p.c_str(), &st) != 0) return std::nullopt;
    return static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
}

Result<void> ModelProvisioner::check_disk_space(const std::string& dir, uint64_t required) const {
    auto available = space_query_(dir);
    if (!available) {
        logging::debug("download: free space of {} unknown, skipping check", dir);
        return {};
    }
    if (*available >= required) return {};

    return make_error(ErrorCode::InsufficientSpace,
                      std::format("not enough disk space in {}: need ~{}, only {} available ({} short)",
                                  dir, megabytes(required), megabytes(*available),
                                  megabytes(required - *available)));
}

Result<uint64_t> ModelProvisioner::validate_file_size(const std::string& path, uint64_t expected,
                                                      double tolerance_percent) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return make_error(ErrorCode::Io, "stat " + path + ": " + ec.message());

    auto min_size = static_cast<uint64_t>(static_cast<double>(expected) * (1.0 - tolerance_percent / 100.0));
    if (size < min_size) {
        fs::remove(path, ec);
        return make_error(ErrorCode::InstallFailed,
                          std::format("download appears corrupted: file is {}, expected at least {}",
                                      megabytes(size), megabytes(min_size)));
    }
    return size;
}

int ModelProvisioner::sweep_stale(const std::string& dir, std::chrono::seconds max_age) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return 0;

    int removed = 0;
    auto now = fs::file_time_type::clock::now();
    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (!name.ends_with(".tmp") && !name.starts_with("temp-extract-")) continue;

        std::error_code entry_ec;
        auto mtime = fs::last_write_time(entry.path(), entry_ec);
        if (entry_ec || now - mtime <= max_age) continue;

        fs::remove_all(entry.path(), entry_ec);
        if (entry_ec) {
            logging::warn("download: cannot remove stale {}: {}", entry.path().string(), entry_ec.message());
            continue;
        }
        logging::info("download: removed stale {}", entry.path().string());
        ++removed;
    }
    return removed;
}
