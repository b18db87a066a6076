#include "api/GatewayController.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

#include "app/GatewayRouter.hpp"
#include "common/Log.hpp"
#include "domain/ShardMap.hpp"
#include "http/HttpJson.hpp"
#include "http/MessageJson.hpp"
#include "http/QueryParams.hpp"

namespace chs::api {
namespace {

constexpr std::size_t kUnboundedLimit = std::numeric_limits<std::size_t>::max();

// Validated here, clamped by the shard.
std::optional<std::size_t> forwardedLimit(const Request& request) {
    const auto raw = chs::http::opt_string(request, "limit");
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    return chs::http::parse_limit(request, kUnboundedLimit, kUnboundedLimit);
}

Response passThrough(const app::GatewayRouter::ShardReply& reply) {
    Response response;
    response.statusCode = static_cast<int>(reply.response.status);
    response.statusText = chs::http::status_reason(response.statusCode);
    response.body = reply.response.body;
    response.contentType = "application/json";
    response.headers.emplace_back("X-Shard-Id", std::to_string(reply.shardId));
    return response;
}

boost::json::object endpointJson(const domain::Endpoint& endpoint) {
    boost::json::object entry;
    entry["host"] = endpoint.host;
    entry["port"] = endpoint.port;
    return entry;
}

boost::json::object descriptorJson(const domain::ShardDescriptor& shard) {
    boost::json::object entry;
    entry["id"] = shard.id;
    entry["health"] = domain::shardHealthToString(shard.health);
    entry["consecutive_failures"] = shard.consecutiveFailures;
    if (shard.lastCheckedMs) {
        entry["last_checked"] = *shard.lastCheckedMs;
    } else {
        entry["last_checked"] = nullptr;
    }
    return entry;
}

Response postMessage(app::GatewayRouter& gateway, const Request& request) {
    const auto body = chs::http::parse_json(request.body);
    const auto& object = chs::http::as_object(body, "message");
    const auto fromUserId = chs::http::required_id(object, "from_user_id");
    chs::http::required_id(object, "to_user_id");
    chs::http::required_string(object, "content");

    return passThrough(gateway.sendMessage(fromUserId, request.body));
}

Response getMessages(app::GatewayRouter& gateway, const Request& request) {
    const auto userId = domain::normalizeUserId(request.param("userId"));
    return passThrough(gateway.messagesFor(userId, forwardedLimit(request)));
}

Response getConversation(app::GatewayRouter& gateway, const Request& request) {
    const auto userId = domain::normalizeUserId(request.param("userId"));
    const auto otherUserId = domain::normalizeUserId(request.param("otherUserId"));
    const auto result = gateway.conversation(userId, otherUserId, forwardedLimit(request));

    boost::json::array queried;
    for (const auto shardId : result.shardsQueried) {
        queried.push_back(shardId);
    }

    boost::json::object payload;
    payload["messages"] = chs::http::to_json(result.messages);
    payload["user_id"] = userId;
    payload["other_user_id"] = otherUserId;
    payload["shards_queried"] = std::move(queried);
    if (!result.shardsFailed.empty()) {
        boost::json::array failed;
        for (const auto shardId : result.shardsFailed) {
            failed.push_back(shardId);
        }
        payload["shards_failed"] = std::move(failed);
    }

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

Response getUsers(app::GatewayRouter& gateway) {
    const auto users = gateway.listUsers();

    boost::json::object payload;
    payload["users"] = chs::http::to_json(users);
    payload["total"] = users.size();

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

Response getShardHealth(app::GatewayRouter& gateway, const Request& request) {
    const auto descriptors = gateway.health();
    boost::json::array shards;

    if (chs::http::opt_flag(request, "probe")) {
        const auto probes = gateway.probe();
        for (std::size_t i = 0; i < descriptors.size(); ++i) {
            auto entry = descriptorJson(descriptors[i]);
            boost::json::array endpoints;
            if (i < probes.size()) {
                for (const auto& probe : probes[i].endpoints) {
                    auto endpoint = endpointJson(probe.endpoint);
                    endpoint["reachable"] = probe.reachable;
                    if (probe.status) {
                        endpoint["status"] = *probe.status;
                    }
                    if (!probe.error.empty()) {
                        endpoint["error"] = probe.error;
                    }
                    endpoints.push_back(std::move(endpoint));
                }
            }
            entry["endpoints"] = std::move(endpoints);
            shards.push_back(std::move(entry));
        }
        LOG_INFO("[GATEWAY] probed " << probes.size() << " shards");
    } else {
        for (const auto& descriptor : descriptors) {
            shards.push_back(descriptorJson(descriptor));
        }
    }

    boost::json::object payload;
    payload["shards"] = std::move(shards);

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

Response getShardTable(app::GatewayRouter& gateway) {
    const auto descriptors = gateway.health();
    boost::json::array shards;
    for (const auto& descriptor : descriptors) {
        auto entry = descriptorJson(descriptor);
        boost::json::array endpoints;
        for (const auto& endpoint : descriptor.endpoints) {
            endpoints.push_back(endpointJson(endpoint));
        }
        entry["endpoints"] = std::move(endpoints);
        shards.push_back(std::move(entry));
    }

    boost::json::object payload;
    payload["shard_count"] = descriptors.size();
    payload["shards"] = std::move(shards);

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

}  // namespace

void registerGatewayRoutes(Router& router, app::GatewayRouter& gateway) {
    router.add("POST", "/api/messages", [&gateway](const Request& request) {
        return postMessage(gateway, request);
    });
    router.add("GET", "/api/messages/:userId", [&gateway](const Request& request) {
        return getMessages(gateway, request);
    });
    router.add("GET", "/api/conversations/:userId/:otherUserId", [&gateway](const Request& request) {
        return getConversation(gateway, request);
    });
    router.add("GET", "/api/users", [&gateway](const Request&) { return getUsers(gateway); });
    router.add("GET", "/api/health/shards", [&gateway](const Request& request) {
        return getShardHealth(gateway, request);
    });
    router.add("GET", "/api/shards", [&gateway](const Request&) { return getShardTable(gateway); });
    router.add("GET", "/health", [](const Request&) { return health("gateway"); });
    router.add("GET", "/stats", [](const Request& request) { return stats(request); });
}

}  // namespace chs::api
