#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "util/log.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::models_dir() const {
    if (!models.cache_dir.empty()) return models.cache_dir;
    auto cache = platform::cache_dir();
    if (cache.empty()) return "/tmp/speechlink/models";
    return cache + "/models";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        logging::warn("config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("streaming")) {
            auto& s = j["streaming"];
            if (s.contains("url")) cfg.streaming.url = s["url"].get<std::string>();
            if (s.contains("language")) cfg.streaming.language = s["language"].get<std::string>();
            if (s.contains("keyterms")) cfg.streaming.keyterms = s["keyterms"].get<std::vector<std::string>>();
            if (s.contains("token_file")) cfg.streaming.token_file = s["token_file"].get<std::string>();
            if (s.contains("prewarm")) cfg.streaming.prewarm = s["prewarm"].get<bool>();
            if (s.contains("sample_rate")) cfg.streaming.sample_rate = s["sample_rate"].get<uint32_t>();
        }

        if (j.contains("local")) {
            auto& l = j["local"];
            if (l.contains("backend")) cfg.local.backend = l["backend"].get<std::string>();
            if (l.contains("whisper_model")) cfg.local.whisper_model = l["whisper_model"].get<std::string>();
            if (l.contains("parakeet_model")) cfg.local.parakeet_model = l["parakeet_model"].get<std::string>();
            if (l.contains("bin_dir")) cfg.local.bin_dir = l["bin_dir"].get<std::string>();
            if (l.contains("language")) cfg.local.language = l["language"].get<std::string>();
            if (l.contains("threads")) cfg.local.threads = l["threads"].get<int>();
            if (l.contains("prefer_gpu")) cfg.local.prefer_gpu = l["prefer_gpu"].get<bool>();
            if (l.contains("prewarm")) cfg.local.prewarm = l["prewarm"].get<bool>();
            if (l.contains("warm_up_inference")) cfg.local.warm_up_inference = l["warm_up_inference"].get<bool>();
        }

        if (j.contains("models")) {
            auto& m = j["models"];
            if (m.contains("cache_dir")) cfg.models.cache_dir = m["cache_dir"].get<std::string>();
            if (m.contains("max_retries")) cfg.models.max_retries = m["max_retries"].get<int>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("chunk_ms")) cfg.audio.chunk_ms = a["chunk_ms"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        logging::warn("config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
