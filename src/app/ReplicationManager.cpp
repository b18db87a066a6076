#include "app/ReplicationManager.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <limits>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {

namespace {

domain::TimestampMs systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

ReplicationManager::ReplicationManager(domain::contracts::IMessageStore& primary,
                                       domain::contracts::IReplicaTarget& backup,
                                       Options options)
    : ReplicationManager(primary, backup, options, systemNowMs) {}

ReplicationManager::ReplicationManager(domain::contracts::IMessageStore& primary,
                                       domain::contracts::IReplicaTarget& backup,
                                       Options options,
                                       NowFn now)
    : primary_(primary), backup_(backup), options_(options), now_(std::move(now)) {}

ReplicationManager::~ReplicationManager() { stop(); }

void ReplicationManager::start() {
    if (worker_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
    }
    worker_ = std::thread([this]() { run(); });
}

void ReplicationManager::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<domain::TimestampMs> ReplicationManager::highWaterMark() const {
    std::lock_guard<std::mutex> lock(markMutex_);
    return highWaterMark_;
}

bool ReplicationManager::waitFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this]() { return stopRequested_; });
}

bool ReplicationManager::initialize() {
    while (true) {
        try {
            primary_.ping();
            backup_.ping();
            LOG_INFO("[REPLICATION-" << options_.shardId << "] primary and backup reachable");
            return true;
        }
        catch (const std::exception& ex) {
            LOG_ERR("[REPLICATION-" << options_.shardId << "] initialization failed: " << ex.what() << "; retrying in "
                                    << options_.retryDelay.count() << "ms");
        }
        if (!waitFor(options_.retryDelay)) {
            return false;
        }
    }
}

void ReplicationManager::run() {
    if (!initialize()) {
        return;
    }
    LOG_INFO("[REPLICATION-" << options_.shardId << "] started, interval " << options_.interval.count()
                             << "ms window " << options_.window.count() << "ms");

    while (waitFor(options_.interval)) {
        try {
            const auto result = tick();
            if (result.messages > 0) {
                LOG_INFO("[REPLICATION-" << options_.shardId << "] replicated " << result.users << " users and "
                                         << result.messages << " messages");
            }
        }
        catch (const std::exception& ex) {
            chs::common::metrics::Registry::instance().incrementCounter("replication.errors");
            LOG_ERR("[REPLICATION-" << options_.shardId << "] tick failed: " << ex.what());
        }
    }
    LOG_INFO("[REPLICATION-" << options_.shardId << "] stopped");
}

ReplicationManager::TickResult ReplicationManager::tick() {
    const auto now = now_();
    const auto windowStart = now - static_cast<domain::TimestampMs>(options_.window.count());

    domain::TimestampMs since = std::numeric_limits<domain::TimestampMs>::min();
    if (const auto mark = highWaterMark()) {
        since = std::min(*mark, windowStart);
    }

    TickResult result;
    const auto users = primary_.allUsers();
    const auto messages = primary_.messagesSince(since);
    const auto batchSize = std::max<std::size_t>(1, options_.batchSize);

    // Users ride with the first batch; an idle shard still sends them.
    std::size_t offset = 0;
    do {
        const auto count = std::min(batchSize, messages.size() - offset);
        const std::vector<domain::Message> batch(messages.begin() + static_cast<std::ptrdiff_t>(offset),
                                                 messages.begin() + static_cast<std::ptrdiff_t>(offset + count));
        backup_.apply(offset == 0 ? users : std::vector<domain::UserRecord>{}, batch);
        offset += count;
        ++result.batches;
    } while (offset < messages.size());

    result.users = users.size();
    result.messages = messages.size();
    std::optional<domain::TimestampMs> newest;
    for (const auto& message : messages) {
        if (!newest || message.createdAtMs > *newest) {
            newest = message.createdAtMs;
        }
    }

    {
        std::lock_guard<std::mutex> lock(markMutex_);
        if (newest && (!highWaterMark_ || *newest > *highWaterMark_)) {
            highWaterMark_ = newest;
        }
        else if (!highWaterMark_) {
            highWaterMark_ = windowStart;
        }
    }

    completedTicks_.fetch_add(1);
    chs::common::metrics::Registry::instance().incrementCounter("replication.ticks");
    return result;
}

}  // namespace app
