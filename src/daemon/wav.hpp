#pragma once

#include "util/error.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

// In-memory RIFF/WAVE handling for 16-bit PCM.
namespace wav {

struct Audio {
    std::vector<int16_t> samples;   // mono
    uint32_t sample_rate = 0;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Parses a PCM16 WAV. Multi-channel input is downmixed to mono.
inline Result<Audio> decode(std::span<const uint8_t> data) {
    auto r16 = [&data](size_t pos) {
        uint16_t v;
        std::memcpy(&v, data.data() + pos, 2);
        return v;
    };
    auto r32 = [&data](size_t pos) {
        uint32_t v;
        std::memcpy(&v, data.data() + pos, 4);
        return v;
    };

    if (data.size() < 12 || std::memcmp(data.data(), "RIFF", 4) != 0 ||
        std::memcmp(data.data() + 8, "WAVE", 4) != 0) {
        return make_error(ErrorCode::InvalidArgument, "not a RIFF/WAVE file");
    }

    uint16_t channels = 0;
    uint16_t bits = 0;
    uint32_t rate = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= data.size()) {
        uint32_t chunk_size = r32(pos + 4);
        size_t body = pos + 8;
        if (std::memcmp(data.data() + pos, "fmt ", 4) == 0) {
            if (chunk_size < 16 || body + 16 > data.size()) {
                return make_error(ErrorCode::InvalidArgument, "truncated fmt chunk");
            }
            if (r16(body) != 1) {
                return make_error(ErrorCode::InvalidArgument, "only PCM WAV is supported");
            }
            channels = r16(body + 2);
            rate = r32(body + 4);
            bits = r16(body + 14);
            have_fmt = true;
        } else if (std::memcmp(data.data() + pos, "data", 4) == 0) {
            if (!have_fmt) {
                return make_error(ErrorCode::InvalidArgument, "data chunk before fmt chunk");
            }
            if (bits != 16 || channels == 0 || rate == 0) {
                return make_error(ErrorCode::InvalidArgument,
                                  "unsupported WAV format: " + std::to_string(bits) + "-bit, " +
                                  std::to_string(channels) + " channel(s)");
            }
            size_t available = std::min<size_t>(chunk_size, data.size() - body);
            size_t frames = available / (2u * channels);

            Audio audio;
            audio.sample_rate = rate;
            audio.samples.resize(frames);
            for (size_t f = 0; f < frames; ++f) {
                int32_t sum = 0;
                for (uint16_t c = 0; c < channels; ++c) {
                    sum += static_cast<int16_t>(r16(body + (f * channels + c) * 2));
                }
                audio.samples[f] = static_cast<int16_t>(sum / channels);
            }
            return audio;
        }
        pos = body + chunk_size + (chunk_size & 1);
    }
    return make_error(ErrorCode::InvalidArgument, "no data chunk in WAV file");
}

inline Result<Audio> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return make_error(ErrorCode::Io, "cannot open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    auto audio = decode(bytes);
    if (!audio) {
        audio.error().message = path + ": " + audio.error().message;
    }
    return audio;
}

inline std::vector<float> to_float32(std::span<const int16_t> samples) {
    std::vector<float> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        out[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return out;
}

} // namespace wav
