#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include "domain/Models.hpp"

namespace app {

// Gateway-owned health view of every shard. Ids are 1..size().
class ShardTable {
public:
    explicit ShardTable(std::vector<domain::ShardDescriptor> shards);

    std::uint32_t shardCount() const noexcept { return static_cast<std::uint32_t>(endpoints_.size()); }

    // Ordered endpoints of a shard, primary first. Throws std::out_of_range.
    const std::vector<domain::Endpoint>& endpoints(domain::ShardId shardId) const;

    void markSuccess(domain::ShardId shardId, domain::TimestampMs nowMs);
    void markFailure(domain::ShardId shardId, domain::TimestampMs nowMs);

    domain::ShardDescriptor descriptor(domain::ShardId shardId) const;
    std::vector<domain::ShardDescriptor> snapshot() const;

private:
    std::size_t indexOf(domain::ShardId shardId) const;

    // Endpoint lists never change after construction and are read without the lock.
    std::vector<std::vector<domain::Endpoint>> endpoints_;

    mutable std::mutex mutex_;
    std::vector<domain::ShardDescriptor> shards_;
};

}  // namespace app
