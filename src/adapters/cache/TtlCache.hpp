#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "domain/Ports.hpp"

namespace adapters::cache {

// In-process key/value cache with per-entry expiry. Expired entries are
// dropped lazily on lookup and during sweeps.
class TtlCache final : public domain::contracts::ICache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    TtlCache();
    explicit TtlCache(NowFn now);

    std::optional<std::string> get(const std::string& key) override;
    void setWithTtl(const std::string& key, std::string value, std::chrono::seconds ttl) override;
    void erase(const std::string& key) override;

    std::size_t size() const;

private:
    struct Entry {
        std::string value;
        Clock::time_point expiresAt;
    };

    void sweepLocked(Clock::time_point now);

    NowFn now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::size_t writesSinceSweep_{0};
};

}  // namespace adapters::cache
