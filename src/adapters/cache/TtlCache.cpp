#include "adapters/cache/TtlCache.hpp"

#include <utility>

namespace adapters::cache {

namespace {

constexpr std::size_t kSweepEveryWrites = 256;

}  // namespace

TtlCache::TtlCache() : TtlCache([]() { return Clock::now(); }) {}

TtlCache::TtlCache(NowFn now) : now_(std::move(now)) {}

std::optional<std::string> TtlCache::get(const std::string& key) {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now >= it->second.expiresAt) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void TtlCache::setWithTtl(const std::string& key, std::string value, std::chrono::seconds ttl) {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{std::move(value), now + ttl};
    if (++writesSinceSweep_ >= kSweepEveryWrites) {
        sweepLocked(now);
    }
}

void TtlCache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
}

std::size_t TtlCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TtlCache::sweepLocked(Clock::time_point now) {
    writesSinceSweep_ = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expiresAt) {
            it = entries_.erase(it);
        }
        else {
            ++it;
        }
    }
}

}  // namespace adapters::cache
