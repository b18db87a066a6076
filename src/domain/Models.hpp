#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {

using UserId = std::string;
using ShardId = std::int32_t;
using TimestampMs = std::int64_t;

struct Message {
    std::string id;
    UserId fromUserId;
    UserId toUserId;
    std::string content;
    TimestampMs createdAtMs{0};
    ShardId shardId{0};
};

struct UserRecord {
    std::int64_t id{0};
    std::string name;
    ShardId shardId{0};
};

enum class ShardHealth {
    Healthy,
    Unhealthy,
};

inline const char* shardHealthToString(ShardHealth health) {
    switch (health) {
    case ShardHealth::Healthy:
        return "healthy";
    case ShardHealth::Unhealthy:
        return "unhealthy";
    }
    return "unhealthy";
}

struct Endpoint {
    std::string host;
    std::uint16_t port{0};

    std::string toString() const { return host + ':' + std::to_string(port); }

    bool operator==(const Endpoint& other) const noexcept {
        return port == other.port && host == other.host;
    }
};

// Primary endpoint first, then backups in failover order.
struct ShardDescriptor {
    ShardId id{0};
    std::vector<Endpoint> endpoints;
    ShardHealth health{ShardHealth::Healthy};
    std::uint32_t consecutiveFailures{0};
    std::optional<TimestampMs> lastCheckedMs{};
};

}  // namespace domain
