#pragma once

#include <cstddef>

#include "api/Router.hpp"

namespace app {
class MessageService;
}

namespace chs::api {

struct ShardRouteOptions {
    std::size_t maxLimit{1000};
};

// REST surface of one shard node: message write, inbox, conversation, users,
// /health and /stats, plus POST /internal/replicate where a standby node
// receives batches from its primary.
void registerShardRoutes(Router& router, app::MessageService& service, ShardRouteOptions options);

}  // namespace chs::api
