#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

// Ordered PCM chunks, capped at max_bytes. Chunks that would exceed the cap
// are dropped, never split.
class AudioFrameBuffer {
public:
    explicit AudioFrameBuffer(size_t max_bytes) : max_bytes_(max_bytes) {}

    bool push(const std::vector<uint8_t>& chunk) {
        if (chunk.empty()) return true;
        if (bytes_ + chunk.size() > max_bytes_) return false;
        bytes_ += chunk.size();
        chunks_.push_back(chunk);
        return true;
    }

    // Moves all chunks out, leaving the buffer empty.
    std::deque<std::vector<uint8_t>> take() {
        bytes_ = 0;
        return std::exchange(chunks_, {});
    }

    // Prepends chunks ahead of anything already buffered. Not subject to the cap.
    void prepend(std::deque<std::vector<uint8_t>> chunks) {
        for (auto it = chunks.rbegin(); it != chunks.rend(); ++it) {
            bytes_ += it->size();
            chunks_.push_front(std::move(*it));
        }
    }

    void clear() {
        chunks_.clear();
        bytes_ = 0;
    }

    bool empty() const { return chunks_.empty(); }
    size_t size() const { return chunks_.size(); }
    size_t bytes() const { return bytes_; }
    size_t max_bytes() const { return max_bytes_; }

private:
    size_t max_bytes_;
    size_t bytes_ = 0;
    std::deque<std::vector<uint8_t>> chunks_;
};
