#pragma once

#include <memory>
#include <string>
#include <variant>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

class ConnectionRegistry;
class MessageService;

namespace push {

struct RegisterCommand {
    domain::UserId userId;
};

struct SendCommand {
    domain::UserId fromUserId;
    domain::UserId toUserId;
    std::string content;
};

struct InvalidCommand {
    std::string reason;
};

using Command = std::variant<RegisterCommand, SendCommand, InvalidCommand>;

// Decodes one text frame. Never throws: malformed JSON, unknown "type" and
// missing fields all become InvalidCommand.
Command decode(const std::string& frame);

std::string registeredReply(const domain::UserId& userId, domain::ShardId shardId);
std::string messageSentReply(const std::string& messageId);
std::string errorReply(const std::string& message);

}  // namespace push

// Executes decoded frames for one WebSocket endpoint of a shard node.
class PushProtocol {
public:
    PushProtocol(ConnectionRegistry& registry, MessageService& service);

    // Handles one frame received on channel and writes the reply to it.
    void onFrame(const std::shared_ptr<domain::contracts::IPushChannel>& channel, const std::string& frame);

    void onClosed(const domain::contracts::IPushChannel& channel);

private:
    std::string execute(const std::shared_ptr<domain::contracts::IPushChannel>& channel,
                        const push::RegisterCommand& command);
    std::string execute(const std::shared_ptr<domain::contracts::IPushChannel>& channel,
                        const push::SendCommand& command);
    std::string execute(const std::shared_ptr<domain::contracts::IPushChannel>& channel,
                        const push::InvalidCommand& command);

    ConnectionRegistry& registry_;
    MessageService& service_;
};

}  // namespace app
