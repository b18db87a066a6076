#include "app/PushProtocol.hpp"

#include <exception>

#include <boost/json/object.hpp>

#include "app/ConnectionRegistry.hpp"
#include "app/MessageService.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"
#include "http/HttpJson.hpp"
#include "http/MessageJson.hpp"

namespace app {

namespace push {

Command decode(const std::string& frame) {
    try {
        const auto value = chs::http::parse_json(frame);
        const auto& object = chs::http::as_object(value, "frame");
        const auto* type = object.if_contains("type");
        if (!type || !type->is_string()) {
            return InvalidCommand{"missing message type"};
        }
        const std::string kind{type->get_string().data(), type->get_string().size()};

        if (kind == "register") {
            return RegisterCommand{chs::http::required_id(object, "user_id")};
        }
        if (kind == "send_message" || kind == "sendMessage") {
            return SendCommand{chs::http::required_id(object, "from_user_id"),
                               chs::http::required_id(object, "to_user_id"),
                               chs::http::required_string(object, "content")};
        }
        return InvalidCommand{"unknown message type: " + kind};
    }
    catch (const domain::ValidationError& ex) {
        return InvalidCommand{ex.what()};
    }
}

std::string registeredReply(const domain::UserId& userId, domain::ShardId shardId) {
    boost::json::object reply;
    reply["type"] = "registered";
    reply["user_id"] = userId;
    reply["shard_id"] = shardId;
    return chs::http::serialize_json(reply);
}

std::string messageSentReply(const std::string& messageId) {
    boost::json::object reply;
    reply["type"] = "message_sent";
    reply["id"] = messageId;
    reply["status"] = "delivered";
    return chs::http::serialize_json(reply);
}

std::string errorReply(const std::string& message) {
    boost::json::object reply;
    reply["type"] = "error";
    reply["message"] = message;
    return chs::http::serialize_json(reply);
}

}  // namespace push

PushProtocol::PushProtocol(ConnectionRegistry& registry, MessageService& service)
    : registry_(registry), service_(service) {}

void PushProtocol::onFrame(const std::shared_ptr<domain::contracts::IPushChannel>& channel,
                           const std::string& frame) {
    const auto command = push::decode(frame);
    const auto reply = std::visit([this, &channel](const auto& decoded) { return execute(channel, decoded); },
                                  command);
    if (!channel->send(reply)) {
        LOG_DEBUG("[SHARD-" << service_.shardId() << "] reply to channel " << channel->channelId() << " dropped");
    }
}

void PushProtocol::onClosed(const domain::contracts::IPushChannel& channel) {
    const auto userId = registry_.removeChannel(channel);
    if (!userId.empty()) {
        LOG_INFO("[SHARD-" << service_.shardId() << "] user " << userId << " disconnected");
    }
}

std::string PushProtocol::execute(const std::shared_ptr<domain::contracts::IPushChannel>& channel,
                                  const push::RegisterCommand& command) {
    registry_.bind(command.userId, channel);
    LOG_INFO("[SHARD-" << service_.shardId() << "] user " << command.userId << " registered on channel "
                       << channel->channelId());
    return push::registeredReply(command.userId, service_.shardId());
}

std::string PushProtocol::execute(const std::shared_ptr<domain::contracts::IPushChannel>&,
                                  const push::SendCommand& command) {
    try {
        const auto message = service_.sendMessage(command.fromUserId, command.toUserId, command.content);
        return push::messageSentReply(message.id);
    }
    catch (const domain::ValidationError& ex) {
        return push::errorReply(ex.what());
    }
    catch (const std::exception& ex) {
        LOG_ERR("[SHARD-" << service_.shardId() << "] push send from " << command.fromUserId << " failed: "
                          << ex.what());
        return push::errorReply("Failed to send message");
    }
}

std::string PushProtocol::execute(const std::shared_ptr<domain::contracts::IPushChannel>&,
                                  const push::InvalidCommand& command) {
    LOG_DEBUG("[SHARD-" << service_.shardId() << "] rejected frame: " << command.reason);
    return push::errorReply(command.reason);
}

}  // namespace app
