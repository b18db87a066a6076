#include "app/ShardTable.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace app {

ShardTable::ShardTable(std::vector<domain::ShardDescriptor> shards) {
    if (shards.empty()) {
        throw std::invalid_argument("shard table requires at least one shard");
    }
    std::sort(shards.begin(), shards.end(), [](const auto& lhs, const auto& rhs) { return lhs.id < rhs.id; });
    for (std::size_t i = 0; i < shards.size(); ++i) {
        if (shards[i].id != static_cast<domain::ShardId>(i + 1)) {
            throw std::invalid_argument("shard ids must be 1.." + std::to_string(shards.size()));
        }
        if (shards[i].endpoints.empty()) {
            throw std::invalid_argument("shard " + std::to_string(shards[i].id) + " has no endpoints");
        }
        endpoints_.push_back(shards[i].endpoints);
    }
    shards_ = std::move(shards);
}

std::size_t ShardTable::indexOf(domain::ShardId shardId) const {
    if (shardId < 1 || static_cast<std::size_t>(shardId) > endpoints_.size()) {
        throw std::out_of_range("unknown shard " + std::to_string(shardId));
    }
    return static_cast<std::size_t>(shardId - 1);
}

const std::vector<domain::Endpoint>& ShardTable::endpoints(domain::ShardId shardId) const {
    return endpoints_[indexOf(shardId)];
}

void ShardTable::markSuccess(domain::ShardId shardId, domain::TimestampMs nowMs) {
    const auto index = indexOf(shardId);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& shard = shards_[index];
    shard.health = domain::ShardHealth::Healthy;
    shard.consecutiveFailures = 0;
    shard.lastCheckedMs = nowMs;
}

void ShardTable::markFailure(domain::ShardId shardId, domain::TimestampMs nowMs) {
    const auto index = indexOf(shardId);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& shard = shards_[index];
    shard.health = domain::ShardHealth::Unhealthy;
    ++shard.consecutiveFailures;
    shard.lastCheckedMs = nowMs;
}

domain::ShardDescriptor ShardTable::descriptor(domain::ShardId shardId) const {
    const auto index = indexOf(shardId);
    std::lock_guard<std::mutex> lock(mutex_);
    return shards_[index];
}

std::vector<domain::ShardDescriptor> ShardTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shards_;
}

}  // namespace app
