#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

class ShardTable;

// Routes client operations to shard nodes: ordered endpoint failover per
// shard, parallel fan-out for multi-shard reads, health bookkeeping.
class GatewayRouter {
public:
    using NowFn = std::function<domain::TimestampMs()>;

    struct ShardReply {
        domain::ShardId shardId{0};
        domain::Endpoint endpoint;
        domain::contracts::TransportResponse response;
    };

    struct ConversationResult {
        std::vector<domain::Message> messages;
        std::vector<domain::ShardId> shardsQueried;
        std::vector<domain::ShardId> shardsFailed;
    };

    struct EndpointProbe {
        domain::Endpoint endpoint;
        bool reachable{false};
        std::optional<unsigned> status;
        std::string error;
    };

    struct ShardProbe {
        domain::ShardId shardId{0};
        std::vector<EndpointProbe> endpoints;
    };

    GatewayRouter(ShardTable& table, domain::contracts::IShardTransport& transport, std::chrono::milliseconds timeout);

    GatewayRouter(ShardTable& table,
                  domain::contracts::IShardTransport& transport,
                  std::chrono::milliseconds timeout,
                  NowFn now);

    // Tries every endpoint of the shard in order. A transport error or a 5xx
    // moves on to the next one; any other status is returned as is. Throws
    // domain::ServiceUnavailableError when all endpoints failed.
    ShardReply get(domain::ShardId shardId, const std::string& target);
    ShardReply post(domain::ShardId shardId, const std::string& target, const std::string& jsonBody);

    // Forwards to the sender's shard. Throws domain::ValidationError for a bad sender id.
    ShardReply sendMessage(const domain::UserId& fromUserId, const std::string& jsonBody);

    ShardReply messagesFor(const domain::UserId& userId, std::optional<std::size_t> limit);

    // Failed sub-queries contribute nothing and are listed in shardsFailed.
    ConversationResult conversation(const domain::UserId& userId,
                                    const domain::UserId& otherId,
                                    std::optional<std::size_t> limit);

    // Users of every shard in shard order; unreachable shards contribute nothing.
    std::vector<domain::UserRecord> listUsers();

    std::vector<domain::ShardDescriptor> health() const;

    // Active GET /health against every endpoint. Does not touch the health table.
    std::vector<ShardProbe> probe();

    domain::ShardId shardFor(const domain::UserId& userId) const;

private:
    using Attempt = std::function<domain::contracts::TransportResponse(const domain::Endpoint&)>;

    ShardReply dispatch(domain::ShardId shardId, const std::string& description, const Attempt& attempt);
    std::optional<std::vector<domain::Message>> tryConversation(domain::ShardId shardId, const std::string& target);

    ShardTable& table_;
    domain::contracts::IShardTransport& transport_;
    std::chrono::milliseconds timeout_;
    NowFn now_;
};

}  // namespace app
