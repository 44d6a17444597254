#pragma once

#include <chrono>
#include <optional>
#include <string>

// Cached bearer token for the streaming endpoint. The issue time only resets
// when a different token value is stored.
class CredentialCache {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultLifetime{300000};
    static constexpr std::chrono::milliseconds kDefaultValidityMargin{30000};

    explicit CredentialCache(std::chrono::milliseconds lifetime = kDefaultLifetime,
                             std::chrono::milliseconds validity_margin = kDefaultValidityMargin);

    void store(const std::string& token, Clock::time_point now);
    void invalidate();

    bool valid(Clock::time_point now) const;
    std::optional<std::string> get(Clock::time_point now) const;

    bool empty() const { return token_.empty(); }
    std::optional<Clock::time_point> issued_at() const { return issued_at_; }
    std::chrono::milliseconds lifetime() const { return lifetime_; }

private:
    std::chrono::milliseconds lifetime_;
    std::chrono::milliseconds validity_margin_;
    std::string token_;
    std::optional<Clock::time_point> issued_at_;
};
