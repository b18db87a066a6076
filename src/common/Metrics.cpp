#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace chs::common::metrics {
namespace {

double percentile(std::vector<double> values, double quantile) {
    std::sort(values.begin(), values.end());
    const double position = std::clamp(quantile, 0.0, 1.0) * static_cast<double>(values.size() - 1U);
    const auto lower = static_cast<std::size_t>(std::floor(position));
    const auto upper = static_cast<std::size_t>(std::ceil(position));
    const double weight = position - static_cast<double>(lower);
    return values[lower] + weight * (values[upper] - values[lower]);
}

}  // namespace

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string routeKey)
    : routeKey_(std::move(routeKey)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
        std::chrono::steady_clock::now() - start_);
    Registry::instance().recordRequest(routeKey_, elapsed.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::recordRequest(const std::string& routeKey, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& route = routes_[routeKey];
    ++route.totalRequests;
    route.recentLatenciesMs.push_back(latencyMs);
    if (route.recentLatenciesMs.size() > kLatencyWindow) {
        route.recentLatenciesMs.pop_front();
    }
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters = counters_;
    snapshot.routes.reserve(routes_.size());
    for (const auto& [routeKey, route] : routes_) {
        RouteSnapshot routeSnapshot;
        routeSnapshot.totalRequests = route.totalRequests;
        if (!route.recentLatenciesMs.empty()) {
            std::vector<double> latencies(route.recentLatenciesMs.begin(), route.recentLatenciesMs.end());
            routeSnapshot.maxMs = *std::max_element(latencies.begin(), latencies.end());
            routeSnapshot.p95Ms = percentile(std::move(latencies), 0.95);
        }
        snapshot.routes.emplace(routeKey, std::move(routeSnapshot));
    }
    return snapshot;
}

}  // namespace chs::common::metrics
