#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/Models.hpp"

namespace domain::contracts {

// Durable, key-indexed message store of one shard. Implementations throw
// domain::StoreError when the underlying engine fails.
class IMessageStore {
public:
    virtual ~IMessageStore() = default;

    virtual void insertMessage(const Message& message) = 0;

    // Messages sent or received by userId, newest first.
    virtual std::vector<Message> messagesForUser(const UserId& userId, std::size_t limit) const = 0;

    // Messages exchanged between both users in either direction, oldest first.
    virtual std::vector<Message> conversation(const UserId& userId,
                                              const UserId& otherId,
                                              std::size_t limit) const = 0;

    // Known users of a shard: stored records plus senders of messages the shard owns.
    virtual std::vector<UserRecord> listUsers(ShardId shardId) const = 0;

    virtual std::vector<UserRecord> allUsers() const = 0;

    // Messages with createdAtMs >= sinceMs, newest first.
    virtual std::vector<Message> messagesSince(TimestampMs sinceMs) const = 0;

    // Conflicting id overwrites name and shard id.
    virtual void upsertUser(const UserRecord& user) = 0;

    // Conflicting id overwrites content only.
    virtual void upsertMessage(const Message& message) = 0;

    virtual void ping() const = 0;
};

// Standby copy of one shard, fed by the replication loop. Implementations
// throw domain::StoreError or domain::TransportError.
class IReplicaTarget {
public:
    virtual ~IReplicaTarget() = default;

    // Upserts with IMessageStore::upsertUser / upsertMessage semantics.
    virtual void apply(const std::vector<UserRecord>& users, const std::vector<Message>& messages) = 0;

    virtual void ping() = 0;
};

// Volatile key-value cache with expiry. Implementations throw domain::CacheError.
class ICache {
public:
    virtual ~ICache() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void setWithTtl(const std::string& key, std::string value, std::chrono::seconds ttl) = 0;
    virtual void erase(const std::string& key) = 0;
};

// One connected client. send() returns false when the channel is gone.
class IPushChannel {
public:
    virtual ~IPushChannel() = default;

    virtual bool send(const std::string& payload) = 0;
    virtual std::uint64_t channelId() const = 0;
};

struct TransportResponse {
    unsigned status{0};
    std::string body;
};

// Gateway-side HTTP transport to one shard endpoint. Throws
// domain::TransportError on connection failure or timeout.
class IShardTransport {
public:
    virtual ~IShardTransport() = default;

    virtual TransportResponse get(const Endpoint& endpoint,
                                  const std::string& target,
                                  std::chrono::milliseconds timeout) = 0;

    virtual TransportResponse post(const Endpoint& endpoint,
                                   const std::string& target,
                                   const std::string& jsonBody,
                                   std::chrono::milliseconds timeout) = 0;
};

}  // namespace domain::contracts
