#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chs::common::metrics {

// Process-wide named counters and per-route request statistics.
class Registry {
public:
    struct RouteSnapshot {
        std::uint64_t totalRequests{0};
        std::optional<double> p95Ms{};
        std::optional<double> maxMs{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, RouteSnapshot> routes;
        std::unordered_map<std::string, std::uint64_t> counters;
    };

    // Records one request and its latency for routeKey on destruction.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string routeKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string routeKey_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void recordRequest(const std::string& routeKey, double latencyMs);
    std::uint64_t counter(const std::string& counterKey) const;
    Snapshot snapshot() const;

private:
    static constexpr std::size_t kLatencyWindow = 1024;

    struct RouteMetrics {
        std::uint64_t totalRequests{0};
        std::deque<double> recentLatenciesMs;
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RouteMetrics> routes_;
    std::unordered_map<std::string, std::uint64_t> counters_;
};

}  // namespace chs::common::metrics
