#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "domain/Models.hpp"

namespace chs::common {

struct GatewayConfig {
    std::uint16_t port = 3000;
    chs::log::Level logLevel = chs::log::Level::Info;
    std::size_t threads = 8;
    std::vector<domain::ShardDescriptor> shards = defaultShards();
    std::uint32_t shardTimeoutMs = 5000;

    bool httpCorsEnable = false;
    std::string httpCorsOrigin;

    static std::vector<domain::ShardDescriptor> defaultShards();

    // Format: "1=host:port|host:port,2=host:port". Ids must be 1..N without gaps.
    static std::vector<domain::ShardDescriptor> parseShards(const std::string& value);

    static GatewayConfig fromArgs(int argc, char** argv);
};

struct ShardNodeConfig {
    domain::ShardId shardId = 1;
    std::uint32_t shardCount = 3;
    std::uint16_t port = 4001;
    chs::log::Level logLevel = chs::log::Level::Info;
    std::size_t threads = 4;

    std::string dbPath = "/data/shard.duckdb";
    std::uint32_t cacheTtlSeconds = 300;

    // Standby node that receives this node's replication batches. A standby
    // itself runs without one.
    std::optional<domain::Endpoint> replicaEndpoint;
    std::uint32_t replicaTimeoutMs = 5000;
    bool replication = true;
    std::uint32_t replicationIntervalMs = 5000;
    std::uint32_t replicationWindowMs = 60000;
    std::uint32_t replicationRetryMs = 5000;

    std::int32_t httpMaxLimit = 1000;

    std::uint32_t wsPingPeriodMs = 30000;
    std::uint32_t wsPongTimeoutMs = 75000;
    std::size_t wsQueueMaxMessages = 500;
    std::size_t wsQueueMaxBytes = 15 * 1024 * 1024;
    std::uint32_t wsStallTimeoutMs = 20000;

    bool httpCorsEnable = false;
    std::string httpCorsOrigin;

    static ShardNodeConfig fromArgs(int argc, char** argv);
};

}  // namespace chs::common
