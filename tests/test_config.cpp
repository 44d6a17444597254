#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "sl_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.streaming.url == "wss://api.deepgram.com/v1/listen");
        REQUIRE(cfg.streaming.language == "auto");
        REQUIRE(cfg.streaming.keyterms.empty());
        REQUIRE(cfg.streaming.token_file.empty());
        REQUIRE_FALSE(cfg.streaming.prewarm);
        REQUIRE(cfg.streaming.sample_rate == 16000);
        REQUIRE(cfg.local.backend == "whisper");
        REQUIRE(cfg.local.whisper_model == "base");
        REQUIRE(cfg.local.parakeet_model == "parakeet-tdt-0.6b-v3");
        REQUIRE(cfg.local.threads == 0);
        REQUIRE_FALSE(cfg.local.prefer_gpu);
        REQUIRE(cfg.local.warm_up_inference);
        REQUIRE(cfg.models.max_retries == 3);
        REQUIRE(cfg.audio.chunk_ms == 100);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "streaming": {
                "url": "ws://127.0.0.1:9000/v1/listen",
                "language": "de",
                "keyterms": ["Kubernetes", "speechlink"],
                "token_file": "/run/user/1000/token",
                "prewarm": true,
                "sample_rate": 48000
            },
            "local": {
                "backend": "parakeet",
                "whisper_model": "small.en",
                "parakeet_model": "parakeet-tdt-0.6b-v2",
                "bin_dir": "/opt/asr/bin",
                "language": "en",
                "threads": 4,
                "prefer_gpu": true,
                "prewarm": true,
                "warm_up_inference": false
            },
            "models": { "cache_dir": "/srv/models", "max_retries": 5 },
            "audio": { "chunk_ms": 50 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.streaming.url == "ws://127.0.0.1:9000/v1/listen");
        REQUIRE(cfg.streaming.language == "de");
        REQUIRE(cfg.streaming.keyterms == std::vector<std::string>{"Kubernetes", "speechlink"});
        REQUIRE(cfg.streaming.token_file == "/run/user/1000/token");
        REQUIRE(cfg.streaming.prewarm);
        REQUIRE(cfg.streaming.sample_rate == 48000);
        REQUIRE(cfg.local.backend == "parakeet");
        REQUIRE(cfg.local.whisper_model == "small.en");
        REQUIRE(cfg.local.parakeet_model == "parakeet-tdt-0.6b-v2");
        REQUIRE(cfg.local.bin_dir == "/opt/asr/bin");
        REQUIRE(cfg.local.language == "en");
        REQUIRE(cfg.local.threads == 4);
        REQUIRE(cfg.local.prefer_gpu);
        REQUIRE(cfg.local.prewarm);
        REQUIRE_FALSE(cfg.local.warm_up_inference);
        REQUIRE(cfg.models.cache_dir == "/srv/models");
        REQUIRE(cfg.models.max_retries == 5);
        REQUIRE(cfg.audio.chunk_ms == 50);
        REQUIRE(cfg.models_dir() == "/srv/models");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "streaming": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.streaming.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.streaming.url == "wss://api.deepgram.com/v1/listen");
        REQUIRE(cfg.local.backend == "whisper");
        REQUIRE(cfg.audio.chunk_ms == 100);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.local.backend == "whisper");
        REQUIRE(cfg.streaming.sample_rate == 16000);
    }

    SECTION("WrongTypeFallsBack") {
        TmpFile f(R"({ "local": { "backend": "parakeet", "threads": "many" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.local.backend == "whisper");
        REQUIRE(cfg.local.threads == 0);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/sl_test_nonexistent_config_file.json");
        REQUIRE(cfg.local.backend == "whisper");
        REQUIRE(cfg.streaming.sample_rate == 16000);
    }

    SECTION("ModelsDirDefault") {
        Config cfg;
        auto dir = cfg.models_dir();
        REQUIRE_FALSE(dir.empty());
        REQUIRE(dir.ends_with("/models"));
    }
}
