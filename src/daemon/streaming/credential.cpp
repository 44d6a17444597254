#include "streaming/credential.hpp"

#include "util/log.hpp"

CredentialCache::CredentialCache(std::chrono::milliseconds lifetime,
                                 std::chrono::milliseconds validity_margin)
    : lifetime_(lifetime), validity_margin_(validity_margin) {}

void CredentialCache::store(const std::string& token, Clock::time_point now) {
    if (token.empty()) return;
    if (token == token_ && issued_at_) return;
    token_ = token;
    issued_at_ = now;
    logging::debug("streaming: credential cached, valid for {}s",
                   std::chrono::duration_cast<std::chrono::seconds>(lifetime_).count());
}

void CredentialCache::invalidate() {
    token_.clear();
    issued_at_.reset();
}

bool CredentialCache::valid(Clock::time_point now) const {
    if (token_.empty() || !issued_at_) return false;
    return now - *issued_at_ < lifetime_ - validity_margin_;
}

std::optional<std::string> CredentialCache::get(Clock::time_point now) const {
    if (!valid(now)) return std::nullopt;
    return token_;
}
