#include <catch2/catch_test_macros.hpp>

#include "models/model_provisioner.hpp"
#include "support/test_http_server.hpp"
#include "support/tmp_dir.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stop_token>
#include <string>
#include <thread>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::string payload(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>('a' + i % 26);
    return s;
}

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

DownloadOptions fast_options() {
    DownloadOptions options;
    options.retry = RetryPolicy{.max_retries = 2, .base_delay = 1ms, .max_delay = 5ms};
    options.connect_timeout = 5000ms;
    return options;
}

} // namespace

TEST_CASE("ModelProvisioner download", "[model_provisioner]") {
    TmpDir dir("sl_test_prov");
    const std::string content = payload(1000);
    auto dest = dir.file("whisper/ggml-test.bin");
    auto options = fast_options();

    SECTION("FreshDownload") {
        TestHttpServer server([&](const TestHttpServer::Request& req) {
            return TestHttpServer::ranged(req, content);
        });

        uint64_t last_done = 0, last_total = 0;
        options.on_progress = [&](uint64_t done, uint64_t total) {
            last_done = done;
            last_total = total;
        };

        ModelProvisioner provisioner;
        auto result = provisioner.download(server.url("/ggml-test.bin"), dest, options);
        REQUIRE(result.has_value());
        REQUIRE(slurp(dest) == content);
        REQUIRE_FALSE(fs::exists(dest + ".tmp"));
        REQUIRE(last_done == 1000);
        REQUIRE(last_total == 1000);
        REQUIRE(server.requests().size() == 1);
        REQUIRE(server.requests()[0].range.empty());
    }

    SECTION("ResumesFromPartialFile") {
        dir.write("whisper/ggml-test.bin.tmp", content.substr(0, 400));
        TestHttpServer server([&](const TestHttpServer::Request& req) {
            return TestHttpServer::ranged(req, content);
        });

        ModelProvisioner provisioner;
        REQUIRE(provisioner.download(server.url("/ggml-test.bin"), dest, options).has_value());
        REQUIRE(slurp(dest) == content);
        REQUIRE(server.requests().size() == 1);
        REQUIRE(server.requests()[0].range == "bytes=400-");
    }

    SECTION("ServerIgnoringRangeRestartsFromZero") {
        dir.write("whisper/ggml-test.bin.tmp", "stale-prefix-bytes");
        TestHttpServer server([&](const TestHttpServer::Request&) {
            TestHttpServer::Reply reply;
            reply.body = content;
            return reply;
        });

        ModelProvisioner provisioner;
        REQUIRE(provisioner.download(server.url("/ggml-test.bin"), dest, options).has_value());
        REQUIRE(slurp(dest) == content);
        REQUIRE(server.requests()[0].range == "bytes=18-");
    }

    SECTION("TruncatedTransferRetriesWithRange") {
        std::atomic<int> calls{0};
        TestHttpServer server([&](const TestHttpServer::Request& req) {
            if (calls++ == 0) {
                TestHttpServer::Reply reply;
                reply.body = content.substr(0, 600);
                reply.content_length = content.size();
                return reply;
            }
            return TestHttpServer::ranged(req, content);
        });

        ModelProvisioner provisioner;
        auto result = provisioner.download(server.url("/ggml-test.bin"), dest, options);
        REQUIRE(result.has_value());
        REQUIRE(slurp(dest) == content);
        auto requests = server.requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[1].range == "bytes=600-");
    }

    SECTION("FollowsRedirects") {
        TestHttpServer server([&](const TestHttpServer::Request& req) {
            if (req.target == "/resolve/main/ggml-test.bin") return TestHttpServer::redirect("/cdn/ggml-test.bin");
            return TestHttpServer::ranged(req, content);
        });

        ModelProvisioner provisioner;
        REQUIRE(provisioner.download(server.url("/resolve/main/ggml-test.bin"), dest, options).has_value());
        REQUIRE(slurp(dest) == content);
        auto requests = server.requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[1].target == "/cdn/ggml-test.bin");
    }

    SECTION("TooManyRedirects") {
        TestHttpServer server([&](const TestHttpServer::Request&) {
            return TestHttpServer::redirect("/loop");
        });

        ModelProvisioner provisioner;
        auto result = provisioner.download(server.url("/loop"), dest, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::HttpStatus);
        REQUIRE(result.error().message.find("redirects") != std::string::npos);
        REQUIRE_FALSE(fs::exists(dest));
    }

    SECTION("HttpErrorIsNotRetried") {
        TestHttpServer server([&](const TestHttpServer::Request&) {
            return TestHttpServer::not_found();
        });

        ModelProvisioner provisioner;
        auto result = provisioner.download(server.url("/missing.bin"), dest, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::HttpStatus);
        REQUIRE(result.error().http_status == 404);
        REQUIRE(server.requests().size() == 1);
        REQUIRE_FALSE(fs::exists(dest));
        REQUIRE_FALSE(fs::exists(dest + ".tmp"));
    }

    SECTION("PersistentTruncationGivesUp") {
        TestHttpServer server([&](const TestHttpServer::Request&) {
            TestHttpServer::Reply reply;
            reply.body = content.substr(0, 10);
            reply.content_length = content.size();
            return reply;
        });

        options.retry.max_retries = 1;
        ModelProvisioner provisioner;
        auto result = provisioner.download(server.url("/ggml-test.bin"), dest, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::IncompleteTransfer);
        REQUIRE(server.requests().size() == 2);
        REQUIRE_FALSE(fs::exists(dest + ".tmp"));
    }

    SECTION("StalledTransferTimesOut") {
        TestHttpServer server([&](const TestHttpServer::Request&) {
            TestHttpServer::Reply reply;
            reply.body = content.substr(0, 100);
            reply.content_length = content.size();
            reply.hang = 3000ms;
            return reply;
        });

        options.retry.max_retries = 0;
        options.stall_timeout = 1000ms;
        ModelProvisioner provisioner;
        auto result = provisioner.download(server.url("/ggml-test.bin"), dest, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::Timeout);
    }

    SECTION("CancelledBeforeStart") {
        TestHttpServer server([&](const TestHttpServer::Request& req) {
            return TestHttpServer::ranged(req, content);
        });

        std::stop_source source;
        source.request_stop();
        ModelProvisioner provisioner;
        auto result = provisioner.download(server.url("/ggml-test.bin"), dest, options, source.get_token());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::Cancelled);
        REQUIRE_FALSE(fs::exists(dest));
    }

    SECTION("CancelledMidTransfer") {
        TestHttpServer server([&](const TestHttpServer::Request&) {
            TestHttpServer::Reply reply;
            reply.body = content.substr(0, 100);
            reply.content_length = content.size();
            reply.hang = 4000ms;
            return reply;
        });

        std::stop_source source;
        std::jthread canceller([&] {
            auto deadline = std::chrono::steady_clock::now() + 3000ms;
            // The temp file appears once the response body starts
            while (std::chrono::steady_clock::now() < deadline && !fs::exists(dest + ".tmp")) {
                std::this_thread::sleep_for(10ms);
            }
            std::this_thread::sleep_for(50ms);
            source.request_stop();
        });

        auto started = std::chrono::steady_clock::now();
        ModelProvisioner provisioner;
        auto result = provisioner.download(server.url("/ggml-test.bin"), dest, options, source.get_token());
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::Cancelled);
        REQUIRE(elapsed < 3500ms);
        REQUIRE(server.requests().size() == 1);
        REQUIRE_FALSE(fs::exists(dest + ".tmp"));
        REQUIRE_FALSE(fs::exists(dest));
    }

    SECTION("InsufficientSpaceFailsBeforeRequest") {
        TestHttpServer server([&](const TestHttpServer::Request& req) {
            return TestHttpServer::ranged(req, content);
        });

        ModelProvisioner provisioner([](const std::string&) { return std::optional<uint64_t>(100); });
        options.required_space = 5'000'000;
        auto result = provisioner.download(server.url("/ggml-test.bin"), dest, options);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InsufficientSpace);
        REQUIRE(server.requests().empty());
    }
}

TEST_CASE("ModelProvisioner disk checks", "[model_provisioner]") {
    TmpDir dir("sl_test_prov");

    SECTION("UnknownSpacePasses") {
        ModelProvisioner provisioner([](const std::string&) { return std::optional<uint64_t>{}; });
        REQUIRE(provisioner.check_disk_space(dir.path.string(), 1'000'000'000'000).has_value());
    }

    SECTION("ShortfallReported") {
        ModelProvisioner provisioner([](const std::string&) { return std::optional<uint64_t>(1'000'000); });
        auto result = provisioner.check_disk_space(dir.path.string(), 3'000'000);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InsufficientSpace);
        REQUIRE(result.error().message.find("2MB short") != std::string::npos);
    }

    SECTION("StatvfsOnMissingDirectory") {
        auto free = ModelProvisioner::statvfs_free_space(dir.file("not/yet/created"));
        REQUIRE(free.has_value());
    }

    SECTION("SizeWithinTolerance") {
        auto path = dir.write("model.bin", std::string(95, 'x'));
        auto size = ModelProvisioner::validate_file_size(path, 100);
        REQUIRE(size.has_value());
        REQUIRE(*size == 95);
        REQUIRE(fs::exists(path));
    }

    SECTION("UndersizedFileDeleted") {
        auto path = dir.write("model.bin", std::string(50, 'x'));
        auto size = ModelProvisioner::validate_file_size(path, 100);
        REQUIRE_FALSE(size.has_value());
        REQUIRE(size.error().code == ErrorCode::InstallFailed);
        REQUIRE_FALSE(fs::exists(path));
    }
}

TEST_CASE("ModelProvisioner sweep", "[model_provisioner]") {
    TmpDir dir("sl_test_prov");
    auto old = fs::file_time_type::clock::now() - 48h;

    auto stale_tmp = dir.write("ggml-base.bin.tmp", "partial");
    fs::last_write_time(stale_tmp, old);
    fs::create_directories(dir.path / "temp-extract-parakeet");
    fs::last_write_time(dir.path / "temp-extract-parakeet", old);
    auto fresh_tmp = dir.write("ggml-small.bin.tmp", "partial");
    auto old_model = dir.write("ggml-tiny.bin", "weights");
    fs::last_write_time(old_model, old);

    REQUIRE(ModelProvisioner::sweep_stale(dir.path.string()) == 2);
    REQUIRE_FALSE(fs::exists(stale_tmp));
    REQUIRE_FALSE(fs::exists(dir.path / "temp-extract-parakeet"));
    REQUIRE(fs::exists(fresh_tmp));
    REQUIRE(fs::exists(old_model));

    REQUIRE(ModelProvisioner::sweep_stale(dir.file("absent")) == 0);
}
