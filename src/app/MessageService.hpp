#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

class ConnectionRegistry;

// Write and read path of one shard node: durable store first, cache-aside
// reads, invalidation on write, push to connected recipients.
class MessageService {
public:
    static constexpr std::size_t kDefaultInboxLimit = 50;
    static constexpr std::size_t kDefaultConversationLimit = 100;

    struct Options {
        domain::ShardId shardId{1};
        std::uint32_t shardCount{1};
        std::chrono::seconds cacheTtl{300};
    };

    using NowFn = std::function<domain::TimestampMs()>;
    using IdFn = std::function<std::string()>;

    MessageService(domain::contracts::IMessageStore& store,
                   domain::contracts::ICache& cache,
                   ConnectionRegistry& registry,
                   Options options);

    MessageService(domain::contracts::IMessageStore& store,
                   domain::contracts::ICache& cache,
                   ConnectionRegistry& registry,
                   Options options,
                   NowFn now,
                   IdFn newId);

    // User ids are accepted in any decimal spelling and stored normalized.
    // Throws domain::ValidationError before any side effect and
    // domain::StoreError when the write is not durable.
    domain::Message sendMessage(const domain::UserId& fromUserId,
                                const domain::UserId& toUserId,
                                const std::string& content);

    std::vector<domain::Message> messagesFor(const domain::UserId& userId, std::size_t limit);

    std::vector<domain::Message> conversation(const domain::UserId& userId,
                                              const domain::UserId& otherId,
                                              std::size_t limit);

    std::vector<domain::UserRecord> listUsers() const;

    // Applies a replication batch from the shard's primary node to this
    // node's store, invalidating the cache keys each message touches.
    void applyReplica(const std::vector<domain::UserRecord>& users, const std::vector<domain::Message>& messages);

    domain::ShardId shardId() const noexcept { return options_.shardId; }

    static std::string inboxKey(const domain::UserId& userId);
    static std::string conversationKey(const domain::UserId& userId, const domain::UserId& otherId);

private:
    std::optional<std::vector<domain::Message>> readCache(const std::string& key, std::size_t limit);
    void writeCache(const std::string& key, const std::vector<domain::Message>& messages, std::size_t limit);
    void invalidate(const std::string& key);
    void invalidateExchange(const domain::UserId& fromUserId, const domain::UserId& toUserId);

    domain::contracts::IMessageStore& store_;
    domain::contracts::ICache& cache_;
    ConnectionRegistry& registry_;
    Options options_;
    NowFn now_;
    IdFn newId_;
};

}  // namespace app
