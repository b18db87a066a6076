#include "api/ShardController.hpp"

#include <string>
#include <utility>
#include <vector>

#include <boost/json/object.hpp>

#include "app/MessageService.hpp"
#include "common/Log.hpp"
#include "domain/ShardMap.hpp"
#include "http/HttpJson.hpp"
#include "http/MessageJson.hpp"
#include "http/QueryParams.hpp"

namespace chs::api {
namespace {

Response postMessage(app::MessageService& service, const Request& request) {
    const auto body = chs::http::parse_json(request.body);
    const auto& object = chs::http::as_object(body, "message");
    const auto fromUserId = chs::http::required_id(object, "from_user_id");
    const auto toUserId = chs::http::required_id(object, "to_user_id");
    const auto content = chs::http::required_string(object, "content");

    const auto message = service.sendMessage(fromUserId, toUserId, content);

    Response response;
    chs::http::write_json(response, chs::http::to_json(message));
    return response;
}

Response getMessages(app::MessageService& service, const ShardRouteOptions& options, const Request& request) {
    const auto userId = domain::normalizeUserId(request.param("userId"));
    const auto limit =
        chs::http::parse_limit(request, app::MessageService::kDefaultInboxLimit, options.maxLimit);

    const auto messages = service.messagesFor(userId, limit);
    LOG_DEBUG("[SHARD-" << service.shardId() << "] inbox " << userId << " -> " << messages.size()
                        << " messages");

    boost::json::object payload;
    payload["messages"] = chs::http::to_json(messages);
    payload["user_id"] = userId;
    payload["shard_id"] = service.shardId();

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

Response getConversation(app::MessageService& service, const ShardRouteOptions& options, const Request& request) {
    const auto userId = domain::normalizeUserId(request.param("userId"));
    const auto otherUserId = domain::normalizeUserId(request.param("otherUserId"));
    const auto limit =
        chs::http::parse_limit(request, app::MessageService::kDefaultConversationLimit, options.maxLimit);

    const auto messages = service.conversation(userId, otherUserId, limit);

    boost::json::object payload;
    payload["messages"] = chs::http::to_json(messages);
    payload["user_id"] = userId;
    payload["other_user_id"] = otherUserId;
    payload["shard_id"] = service.shardId();

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

Response getUsers(app::MessageService& service) {
    boost::json::object payload;
    payload["users"] = chs::http::to_json(service.listUsers());
    payload["shard_id"] = service.shardId();

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

Response postReplica(app::MessageService& service, const Request& request) {
    const auto body = chs::http::parse_json(request.body);
    const auto& object = chs::http::as_object(body, "replica batch");

    std::vector<domain::UserRecord> users;
    if (const auto* field = object.if_contains("users")) {
        users = chs::http::users_from_json(*field);
    }
    std::vector<domain::Message> messages;
    if (const auto* field = object.if_contains("messages")) {
        messages = chs::http::messages_from_json(*field);
    }

    service.applyReplica(users, messages);

    boost::json::object payload;
    payload["users"] = users.size();
    payload["messages"] = messages.size();
    payload["shard_id"] = service.shardId();

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

}  // namespace

void registerShardRoutes(Router& router, app::MessageService& service, ShardRouteOptions options) {
    const std::string serviceName = "shard-" + std::to_string(service.shardId());

    router.add("POST", "/api/messages", [&service](const Request& request) {
        return postMessage(service, request);
    });
    router.add("GET", "/api/messages/:userId", [&service, options](const Request& request) {
        return getMessages(service, options, request);
    });
    router.add("GET", "/api/conversations/:userId/:otherUserId", [&service, options](const Request& request) {
        return getConversation(service, options, request);
    });
    router.add("GET", "/api/users", [&service](const Request&) { return getUsers(service); });
    router.add("POST", "/internal/replicate", [&service](const Request& request) {
        return postReplica(service, request);
    });
    router.add("GET", "/health", [serviceName](const Request&) { return health(serviceName); });
    router.add("GET", "/stats", [](const Request& request) { return stats(request); });
}

}  // namespace chs::api
