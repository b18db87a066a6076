#include "app/GatewayRouter.hpp"

#include <exception>
#include <future>
#include <string>
#include <utility>

#include "app/ConversationMerge.hpp"
#include "app/ShardTable.hpp"
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

std::string withLimit(std::string target, std::optional<std::size_t> limit) {
    if (limit) {
        target += "?limit=" + std::to_string(*limit);
    }
    return target;
}

void incrementCounter(const char* name) {
    chs::common::metrics::Registry::instance().incrementCounter(name);
}

}  // namespace

GatewayRouter::GatewayRouter(ShardTable& table,
                             domain::contracts::IShardTransport& transport,
                             std::chrono::milliseconds timeout)
    : GatewayRouter(table, transport, timeout, systemNowMs) {}

GatewayRouter::GatewayRouter(ShardTable& table,
                             domain::contracts::IShardTransport& transport,
                             std::chrono::milliseconds timeout,
                             NowFn now)
    : table_(table), transport_(transport), timeout_(timeout), now_(std::move(now)) {}

domain::ShardId GatewayRouter::shardFor(const domain::UserId& userId) const {
    const auto shardId = domain::shardOf(userId, table_.shardCount());
    LOG_DEBUG("[GATEWAY] user " << userId << " maps to shard " << shardId);
    return shardId;
}

GatewayRouter::ShardReply GatewayRouter::dispatch(domain::ShardId shardId,
                                                  const std::string& description,
                                                  const Attempt& attempt) {
    const auto& endpoints = table_.endpoints(shardId);
    std::string lastError;

    for (const auto& endpoint : endpoints) {
        try {
            auto response = attempt(endpoint);
            if (response.status >= 500) {
                lastError = endpoint.toString() + " answered " + std::to_string(response.status);
                LOG_WARN("[GATEWAY] shard " << shardId << ' ' << description << " via " << endpoint.toString()
                                            << " failed: status " << response.status);
                incrementCounter("shard.attempt.fail");
                continue;
            }
            LOG_INFO("[GATEWAY] shard " << shardId << ' ' << description << " via " << endpoint.toString()
                                        << " ok: status " << response.status);
            incrementCounter("shard.attempt.ok");
            table_.markSuccess(shardId, now_());
            return ShardReply{shardId, endpoint, std::move(response)};
        }
        catch (const domain::TransportError& ex) {
            lastError = ex.what();
            LOG_WARN("[GATEWAY] shard " << shardId << ' ' << description << " via " << endpoint.toString()
                                        << " failed: " << ex.what());
            incrementCounter("shard.attempt.fail");
        }
    }

    table_.markFailure(shardId, now_());
    incrementCounter("shard.unavailable");
    LOG_ERR("[GATEWAY] shard " << shardId << " unavailable: all " << endpoints.size() << " endpoints failed");
    throw domain::ServiceUnavailableError("all endpoints of shard " + std::to_string(shardId)
                                          + " failed; last error: " + lastError);
}

GatewayRouter::ShardReply GatewayRouter::get(domain::ShardId shardId, const std::string& target) {
    return dispatch(shardId, "GET " + target, [this, &target](const domain::Endpoint& endpoint) {
        return transport_.get(endpoint, target, timeout_);
    });
}

GatewayRouter::ShardReply GatewayRouter::post(domain::ShardId shardId,
                                              const std::string& target,
                                              const std::string& jsonBody) {
    return dispatch(shardId, "POST " + target, [this, &target, &jsonBody](const domain::Endpoint& endpoint) {
        return transport_.post(endpoint, target, jsonBody, timeout_);
    });
}

GatewayRouter::ShardReply GatewayRouter::sendMessage(const domain::UserId& fromUserId, const std::string& jsonBody) {
    const auto shardId = shardFor(fromUserId);
    LOG_INFO("[GATEWAY] routing message from user " << fromUserId << " to shard " << shardId);
    return post(shardId, "/api/messages", jsonBody);
}

GatewayRouter::ShardReply GatewayRouter::messagesFor(const domain::UserId& userId, std::optional<std::size_t> limit) {
    const auto shardId = shardFor(userId);
    return get(shardId, withLimit("/api/messages/" + userId, limit));
}

std::optional<std::vector<domain::Message>> GatewayRouter::tryConversation(domain::ShardId shardId,
                                                                          const std::string& target) {
    try {
        const auto reply = get(shardId, target);
        if (reply.response.status != 200) {
            LOG_WARN("[GATEWAY] shard " << shardId << " rejected conversation read: status " << reply.response.status);
            return std::nullopt;
        }
        const auto body = chs::http::parse_json(reply.response.body);
        const auto* messages = chs::http::as_object(body, "conversation").if_contains("messages");
        if (!messages) {
            return std::vector<domain::Message>{};
        }
        return chs::http::messages_from_json(*messages);
    }
    catch (const std::exception& ex) {
        LOG_WARN("[GATEWAY] conversation read on shard " << shardId << " failed: " << ex.what());
        return std::nullopt;
    }
}

GatewayRouter::ConversationResult GatewayRouter::conversation(const domain::UserId& userId,
                                                              const domain::UserId& otherId,
                                                              std::optional<std::size_t> limit) {
    const auto userShard = shardFor(userId);
    const auto otherShard = shardFor(otherId);
    const auto target = withLimit("/api/conversations/" + userId + '/' + otherId, limit);

    ConversationResult result;
    result.shardsQueried.push_back(userShard);

    if (userShard == otherShard) {
        auto messages = tryConversation(userShard, target);
        if (!messages) {
            result.shardsFailed.push_back(userShard);
        }
        result.messages = mergeConversation(messages.value_or(std::vector<domain::Message>{}), {});
        return result;
    }

    result.shardsQueried.push_back(otherShard);
    LOG_INFO("[GATEWAY] conversation " << userId << " (shard " << userShard << ") <-> " << otherId << " (shard "
                                       << otherShard << ')');

    auto userFuture =
        std::async(std::launch::async, [this, userShard, &target]() { return tryConversation(userShard, target); });
    auto otherFuture =
        std::async(std::launch::async, [this, otherShard, &target]() { return tryConversation(otherShard, target); });

    auto userMessages = userFuture.get();
    auto otherMessages = otherFuture.get();
    if (!userMessages) {
        result.shardsFailed.push_back(userShard);
    }
    if (!otherMessages) {
        result.shardsFailed.push_back(otherShard);
    }

    result.messages = mergeConversation(userMessages.value_or(std::vector<domain::Message>{}),
                                        otherMessages.value_or(std::vector<domain::Message>{}));
    return result;
}

std::vector<domain::UserRecord> GatewayRouter::listUsers() {
    std::vector<std::future<std::vector<domain::UserRecord>>> pending;
    pending.reserve(table_.shardCount());

    for (domain::ShardId shardId = 1; shardId <= static_cast<domain::ShardId>(table_.shardCount()); ++shardId) {
        pending.push_back(std::async(std::launch::async, [this, shardId]() {
            try {
                const auto reply = get(shardId, "/api/users");
                if (reply.response.status != 200) {
                    LOG_WARN("[GATEWAY] shard " << shardId << " rejected user listing: status "
                                                << reply.response.status);
                    return std::vector<domain::UserRecord>{};
                }
                const auto body = chs::http::parse_json(reply.response.body);
                const auto* users = chs::http::as_object(body, "user listing").if_contains("users");
                return users ? chs::http::users_from_json(*users) : std::vector<domain::UserRecord>{};
            }
            catch (const std::exception& ex) {
                LOG_WARN("[GATEWAY] user listing on shard " << shardId << " failed: " << ex.what());
                return std::vector<domain::UserRecord>{};
            }
        }));
    }

    std::vector<domain::UserRecord> users;
    for (auto& future : pending) {
        auto shardUsers = future.get();
        users.insert(users.end(), shardUsers.begin(), shardUsers.end());
    }
    return users;
}

std::vector<domain::ShardDescriptor> GatewayRouter::health() const {
    return table_.snapshot();
}

std::vector<GatewayRouter::ShardProbe> GatewayRouter::probe() {
    std::vector<ShardProbe> shards;
    std::vector<std::vector<std::future<EndpointProbe>>> pending;

    for (domain::ShardId shardId = 1; shardId <= static_cast<domain::ShardId>(table_.shardCount()); ++shardId) {
        shards.push_back(ShardProbe{shardId, {}});
        auto& shardPending = pending.emplace_back();
        for (const auto& endpoint : table_.endpoints(shardId)) {
            shardPending.push_back(std::async(std::launch::async, [this, endpoint]() {
                EndpointProbe result{endpoint, false, std::nullopt, {}};
                try {
                    const auto response = transport_.get(endpoint, "/health", timeout_);
                    result.status = response.status;
                    result.reachable = response.status == 200;
                }
                catch (const domain::TransportError& ex) {
                    result.error = ex.what();
                }
                return result;
            }));
        }
    }

    for (std::size_t i = 0; i < shards.size(); ++i) {
        for (auto& future : pending[i]) {
            shards[i].endpoints.push_back(future.get());
        }
    }
    return shards;
}

}  // namespace app
