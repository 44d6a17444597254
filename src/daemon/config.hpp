#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Streaming {
        std::string url = "wss://api.deepgram.com/v1/listen";
        std::string language = "auto";
        std::vector<std::string> keyterms;
        // File holding the current bearer token; rewritten by whoever mints tokens.
        std::string token_file;
        bool prewarm = false;
        uint32_t sample_rate = 16000;
    } streaming;

    struct Local {
        std::string backend = "whisper";    // "whisper" or "parakeet"
        std::string whisper_model = "base";
        std::string parakeet_model = "parakeet-tdt-0.6b-v3";
        std::string bin_dir;
        std::string language = "auto";
        int threads = 0;                    // 0 = backend default
        bool prefer_gpu = false;
        bool prewarm = false;
        bool warm_up_inference = true;
    } local;

    struct Models {
        std::string cache_dir;              // empty = <XDG cache>/models
        int max_retries = 3;
    } models;

    struct Audio {
        uint32_t chunk_ms = 100;
    } audio;

    // Resolved models directory, honouring the XDG default.
    std::string models_dir() const;

    static Config load(const std::string& path);
    static Config load_default();
};
