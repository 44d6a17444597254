#include <catch2/catch_test_macros.hpp>

#include "models/model_installer.hpp"
#include "support/test_http_server.hpp"
#include "support/tmp_dir.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

// Packs <top>/<files...> into a tar.bz2 and returns its bytes, or "" if tar failed.
std::string make_archive(const TmpDir& dir, const std::string& top, const std::vector<std::string>& files) {
    for (auto& f : files) dir.write("src/" + top + "/" + f, "onnx:" + f);
    auto archive = dir.file("packed.tar.bz2");
    auto cmd = "tar -cjf '" + archive + "' -C '" + dir.file("src") + "' '" + top + "' 2>/dev/null";
    if (std::system(cmd.c_str()) != 0) return {};
    return slurp(archive);
}

ModelInfo whisper_model(const TestHttpServer& server, uint64_t size) {
    return ModelInfo{
        .id = "test",
        .family = ModelFamily::Whisper,
        .url = server.url("/ggml-test.bin"),
        .size_bytes = size,
        .file_name = "ggml-test.bin",
        .required_files = {"ggml-test.bin"},
    };
}

ModelInfo parakeet_model(const TestHttpServer& server, uint64_t size) {
    return ModelInfo{
        .id = "parakeet-test",
        .family = ModelFamily::Parakeet,
        .url = server.url("/parakeet-test.tar.bz2"),
        .size_bytes = size,
        .file_name = "sherpa-onnx-parakeet-test",
        .required_files = {"encoder.onnx", "decoder.onnx", "joiner.onnx", "tokens.txt"},
    };
}

RetryPolicy no_retry() {
    return RetryPolicy{.max_retries = 0, .base_delay = 1ms, .max_delay = 1ms};
}

} // namespace

TEST_CASE("ModelInstaller whisper models", "[model_installer]") {
    TmpDir cache("sl_test_inst");
    const std::string weights(1000, 'w');
    std::string served = weights;
    TestHttpServer server([&](const TestHttpServer::Request& req) {
        return TestHttpServer::ranged(req, served);
    });
    ModelProvisioner provisioner;
    ModelInstaller installer(cache.path.string(), provisioner, {whisper_model(server, weights.size())});
    const ModelInfo* model = installer.find(ModelFamily::Whisper, "test");
    REQUIRE(model != nullptr);

    SECTION("Layout") {
        REQUIRE(installer.family_dir(ModelFamily::Whisper) == (cache.path / "whisper").string());
        REQUIRE(installer.model_dir(*model) == (cache.path / "whisper" / "test").string());
        REQUIRE(installer.model_path(*model) == (cache.path / "whisper" / "test" / "ggml-test.bin").string());
        REQUIRE(installer.find(ModelFamily::Parakeet, "test") == nullptr);
    }

    SECTION("InstallAndList") {
        auto before = installer.list();
        REQUIRE(before.size() == 1);
        REQUIRE_FALSE(before[0].installed);

        std::string progress_model;
        uint64_t progress_done = 0;
        auto path = installer.install(*model, {}, [&](const ModelInfo& m, uint64_t done, uint64_t) {
            progress_model = m.id;
            progress_done = done;
        }, no_retry());
        REQUIRE(path.has_value());
        REQUIRE(*path == installer.model_path(*model));
        REQUIRE(slurp(*path) == weights);
        REQUIRE(progress_model == "test");
        REQUIRE(progress_done == weights.size());

        REQUIRE(installer.is_installed(*model));
        auto after = installer.list();
        REQUIRE(after[0].installed);
        REQUIRE(after[0].path == *path);
    }

    SECTION("AlreadyInstalledSkipsDownload") {
        REQUIRE(installer.install(*model, {}, {}, no_retry()).has_value());
        REQUIRE(installer.install(*model, {}, {}, no_retry()).has_value());
        REQUIRE(server.requests().size() == 1);
    }

    SECTION("UndersizedDownloadRejected") {
        served = std::string(500, 'w');
        auto path = installer.install(*model, {}, {}, no_retry());
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code == ErrorCode::InstallFailed);
        REQUIRE_FALSE(installer.is_installed(*model));
        REQUIRE_FALSE(fs::exists(installer.model_path(*model)));
    }

    SECTION("Remove") {
        REQUIRE(installer.install(*model, {}, {}, no_retry()).has_value());
        REQUIRE(installer.remove(*model).has_value());
        REQUIRE_FALSE(installer.is_installed(*model));
        REQUIRE_FALSE(fs::exists(installer.model_dir(*model)));

        auto again = installer.remove(*model);
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("EmptyFileIsNotInstalled") {
        cache.write("whisper/test/ggml-test.bin", "");
        REQUIRE_FALSE(installer.is_installed(*model));
    }

    SECTION("SweepRemovesStaleLeftovers") {
        auto stale = cache.write("whisper/test/ggml-test.bin.tmp", "partial");
        fs::last_write_time(stale, fs::file_time_type::clock::now() - 48h);
        REQUIRE(installer.sweep() == 1);
        REQUIRE_FALSE(fs::exists(stale));
    }
}

TEST_CASE("ModelInstaller disk space", "[model_installer]") {
    TmpDir cache("sl_test_inst");
    TestHttpServer server([](const TestHttpServer::Request&) { return TestHttpServer::not_found(); });
    ModelProvisioner provisioner([](const std::string&) { return std::optional<uint64_t>(1000); });

    SECTION("FileNeedsHeadroom") {
        ModelInstaller installer(cache.path.string(), provisioner, {whisper_model(server, 900)});
        auto result = installer.install(*installer.find(ModelFamily::Whisper, "test"), {}, {}, no_retry());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InsufficientSpace);
        REQUIRE(server.requests().empty());
    }

    SECTION("ArchiveNeedsRoomToExtract") {
        ModelInstaller installer(cache.path.string(), provisioner, {parakeet_model(server, 500)});
        auto result = installer.install(*installer.find(ModelFamily::Parakeet, "parakeet-test"), {}, {}, no_retry());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InsufficientSpace);
        REQUIRE(server.requests().empty());
    }
}

TEST_CASE("ModelInstaller archives", "[model_installer]") {
    TmpDir cache("sl_test_inst");
    TmpDir work("sl_test_arc");
    std::string archive;
    TestHttpServer server([&](const TestHttpServer::Request& req) {
        return TestHttpServer::ranged(req, archive);
    });
    ModelProvisioner provisioner;
    const std::vector<std::string> files = {"encoder.onnx", "decoder.onnx", "joiner.onnx", "tokens.txt"};

    SECTION("ExtractsIntoModelDirectory") {
        archive = make_archive(work, "sherpa-onnx-parakeet-test", files);
        if (archive.empty()) SKIP("tar with bzip2 support is not available");

        ModelInstaller installer(cache.path.string(), provisioner, {parakeet_model(server, archive.size())});
        auto* model = installer.find(ModelFamily::Parakeet, "parakeet-test");
        auto path = installer.install(*model, {}, {}, no_retry());
        REQUIRE(path.has_value());
        REQUIRE(*path == installer.model_dir(*model));
        REQUIRE(installer.is_installed(*model));
        REQUIRE(slurp(*path + "/tokens.txt") == "onnx:tokens.txt");
        REQUIRE_FALSE(fs::exists(cache.path / "parakeet" / "parakeet-test.tar.bz2"));
        REQUIRE_FALSE(fs::exists(cache.path / "parakeet" / "temp-extract-parakeet-test"));
    }

    SECTION("AcceptsRenamedTopDirectory") {
        archive = make_archive(work, "sherpa-onnx-nemo-parakeet-test-int8", files);
        if (archive.empty()) SKIP("tar with bzip2 support is not available");

        ModelInstaller installer(cache.path.string(), provisioner, {parakeet_model(server, archive.size())});
        auto* model = installer.find(ModelFamily::Parakeet, "parakeet-test");
        REQUIRE(installer.install(*model, {}, {}, no_retry()).has_value());
        REQUIRE(installer.is_installed(*model));
    }

    SECTION("MissingRequiredFiles") {
        archive = make_archive(work, "sherpa-onnx-parakeet-test", {"encoder.onnx", "tokens.txt"});
        if (archive.empty()) SKIP("tar with bzip2 support is not available");

        ModelInstaller installer(cache.path.string(), provisioner, {parakeet_model(server, archive.size())});
        auto* model = installer.find(ModelFamily::Parakeet, "parakeet-test");
        auto path = installer.install(*model, {}, {}, no_retry());
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code == ErrorCode::InstallFailed);
        REQUIRE(path.error().message.find("decoder.onnx") != std::string::npos);
        REQUIRE_FALSE(installer.is_installed(*model));
        REQUIRE_FALSE(fs::exists(installer.model_dir(*model)));
    }

    SECTION("CorruptArchive") {
        archive = std::string(2000, 'z');
        ModelInstaller installer(cache.path.string(), provisioner, {parakeet_model(server, archive.size())});
        auto* model = installer.find(ModelFamily::Parakeet, "parakeet-test");
        auto path = installer.install(*model, {}, {}, no_retry());
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code == ErrorCode::InstallFailed);
    }
}
