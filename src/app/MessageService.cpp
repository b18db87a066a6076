#include "app/MessageService.hpp"

#include <exception>
#include <set>
#include <utility>

#include <boost/json/object.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "app/ConnectionRegistry.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "domain/ShardMap.hpp"
#include "http/HttpJson.hpp"
#include "http/MessageJson.hpp"

namespace app {

namespace {

domain::TimestampMs systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string randomUuid() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

void requireLimit(std::size_t limit) {
    if (limit == 0) {
        throw domain::ValidationError("limit must be positive");
    }
}

void incrementCounter(const char* name) {
    chs::common::metrics::Registry::instance().incrementCounter(name);
}

}  // namespace

MessageService::MessageService(domain::contracts::IMessageStore& store,
                               domain::contracts::ICache& cache,
                               ConnectionRegistry& registry,
                               Options options)
    : MessageService(store, cache, registry, options, systemNowMs, randomUuid) {}

MessageService::MessageService(domain::contracts::IMessageStore& store,
                               domain::contracts::ICache& cache,
                               ConnectionRegistry& registry,
                               Options options,
                               NowFn now,
                               IdFn newId)
    : store_(store),
      cache_(cache),
      registry_(registry),
      options_(options),
      now_(std::move(now)),
      newId_(std::move(newId)) {
    if (options_.shardCount == 0 || options_.shardId < 1
        || options_.shardId > static_cast<domain::ShardId>(options_.shardCount)) {
        throw domain::ValidationError("shard id " + std::to_string(options_.shardId) + " outside 1.."
                                      + std::to_string(options_.shardCount));
    }
}

std::string MessageService::inboxKey(const domain::UserId& userId) {
    return "user:messages:" + userId;
}

std::string MessageService::conversationKey(const domain::UserId& userId, const domain::UserId& otherId) {
    return "conv:" + userId + ':' + otherId;
}

domain::Message MessageService::sendMessage(const domain::UserId& rawFromUserId,
                                            const domain::UserId& rawToUserId,
                                            const std::string& content) {
    if (rawFromUserId.empty() || rawToUserId.empty()) {
        throw domain::ValidationError("from_user_id and to_user_id are required");
    }
    if (content.empty()) {
        throw domain::ValidationError("content must not be empty");
    }
    const auto fromUserId = domain::normalizeUserId(rawFromUserId);
    const auto toUserId = domain::normalizeUserId(rawToUserId);
    const auto senderShard = domain::shardOf(fromUserId, options_.shardCount);

    if (senderShard != options_.shardId) {
        LOG_WARN("[SHARD-" << options_.shardId << "] misrouted write: sender " << fromUserId << " belongs to shard "
                           << senderShard);
        incrementCounter("write.misrouted");
    }

    domain::Message message;
    message.id = newId_();
    message.fromUserId = fromUserId;
    message.toUserId = toUserId;
    message.content = content;
    message.createdAtMs = now_();
    message.shardId = options_.shardId;

    store_.insertMessage(message);
    LOG_INFO("[SHARD-" << options_.shardId << "] message " << message.id << " stored (" << fromUserId << " -> "
                       << toUserId << ')');

    invalidateExchange(fromUserId, toUserId);

    if (registry_.find(toUserId)) {
        auto payload = chs::http::to_json(message);
        payload["type"] = "message";
        bool delivered = false;
        try {
            delivered = registry_.push(toUserId, chs::http::serialize_json(payload));
        }
        catch (const std::exception& ex) {
            LOG_WARN("[SHARD-" << options_.shardId << "] push to " << toUserId << " threw: " << ex.what());
        }
        if (delivered) {
            incrementCounter("push.sent");
        }
        else {
            incrementCounter("push.failed");
            LOG_WARN("[SHARD-" << options_.shardId << "] push to " << toUserId << " failed");
        }
    }

    return message;
}

std::vector<domain::Message> MessageService::messagesFor(const domain::UserId& rawUserId, std::size_t limit) {
    const auto userId = domain::normalizeUserId(rawUserId);
    requireLimit(limit);

    const auto key = inboxKey(userId);
    if (auto cached = readCache(key, limit)) {
        return std::move(*cached);
    }

    auto messages = store_.messagesForUser(userId, limit);
    writeCache(key, messages, limit);
    LOG_DEBUG("[SHARD-" << options_.shardId << "] " << messages.size() << " messages for user " << userId);
    return messages;
}

std::vector<domain::Message> MessageService::conversation(const domain::UserId& rawUserId,
                                                          const domain::UserId& rawOtherId,
                                                          std::size_t limit) {
    const auto userId = domain::normalizeUserId(rawUserId);
    const auto otherId = domain::normalizeUserId(rawOtherId);
    requireLimit(limit);

    const auto key = conversationKey(userId, otherId);
    if (auto cached = readCache(key, limit)) {
        return std::move(*cached);
    }

    auto messages = store_.conversation(userId, otherId, limit);
    writeCache(key, messages, limit);
    LOG_DEBUG("[SHARD-" << options_.shardId << "] conversation " << userId << " <-> " << otherId << ": "
                        << messages.size() << " messages");
    return messages;
}

std::vector<domain::UserRecord> MessageService::listUsers() const {
    return store_.listUsers(options_.shardId);
}

void MessageService::applyReplica(const std::vector<domain::UserRecord>& users,
                                  const std::vector<domain::Message>& messages) {
    for (const auto& user : users) {
        store_.upsertUser(user);
    }

    std::set<std::pair<domain::UserId, domain::UserId>> exchanges;
    for (const auto& message : messages) {
        if (message.id.empty()) {
            throw domain::ValidationError("replicated message without id");
        }
        store_.upsertMessage(message);
        exchanges.emplace(message.fromUserId, message.toUserId);
    }
    for (const auto& [fromUserId, toUserId] : exchanges) {
        invalidateExchange(fromUserId, toUserId);
    }

    incrementCounter("replica.batches_applied");
    LOG_DEBUG("[SHARD-" << options_.shardId << "] applied replica batch: " << users.size() << " users, "
                        << messages.size() << " messages");
}

std::optional<std::vector<domain::Message>> MessageService::readCache(const std::string& key, std::size_t limit) {
    std::optional<std::string> raw;
    try {
        raw = cache_.get(key);
    }
    catch (const std::exception& ex) {
        LOG_WARN("[SHARD-" << options_.shardId << "] cache read " << key << " failed: " << ex.what());
    }
    if (!raw) {
        incrementCounter("cache.miss");
        return std::nullopt;
    }

    try {
        const auto value = chs::http::parse_json(*raw);
        const auto& object = chs::http::as_object(value, "cache entry");
        const auto* storedLimit = object.if_contains("limit");
        const auto* messages = object.if_contains("messages");
        if (!storedLimit || !storedLimit->is_int64() || !messages
            || storedLimit->get_int64() < static_cast<std::int64_t>(limit)) {
            incrementCounter("cache.miss");
            return std::nullopt;
        }
        auto result = chs::http::messages_from_json(*messages);
        if (result.size() > limit) {
            result.resize(limit);
        }
        incrementCounter("cache.hit");
        return result;
    }
    catch (const std::exception& ex) {
        LOG_WARN("[SHARD-" << options_.shardId << "] discarding unreadable cache entry " << key << ": " << ex.what());
        invalidate(key);
    }
    incrementCounter("cache.miss");
    return std::nullopt;
}

void MessageService::writeCache(const std::string& key,
                                const std::vector<domain::Message>& messages,
                                std::size_t limit) {
    boost::json::object entry;
    entry["limit"] = static_cast<std::int64_t>(limit);
    entry["messages"] = chs::http::to_json(messages);
    try {
        cache_.setWithTtl(key, chs::http::serialize_json(entry), options_.cacheTtl);
    }
    catch (const std::exception& ex) {
        LOG_WARN("[SHARD-" << options_.shardId << "] cache write " << key << " failed: " << ex.what());
    }
}

void MessageService::invalidateExchange(const domain::UserId& fromUserId, const domain::UserId& toUserId) {
    invalidate(conversationKey(fromUserId, toUserId));
    invalidate(conversationKey(toUserId, fromUserId));
    invalidate(inboxKey(fromUserId));
    invalidate(inboxKey(toUserId));
}

void MessageService::invalidate(const std::string& key) {
    try {
        cache_.erase(key);
    }
    catch (const std::exception& ex) {
        LOG_WARN("[SHARD-" << options_.shardId << "] cache invalidation " << key << " failed: " << ex.what());
    }
}

}  // namespace app
