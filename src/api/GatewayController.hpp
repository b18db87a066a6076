#pragma once

#include "api/Router.hpp"

namespace app {
class GatewayRouter;
}

namespace chs::api {

// REST surface of the gateway. Directed calls pass the shard's status and
// body through; multi-shard reads are assembled here.
void registerGatewayRoutes(Router& router, app::GatewayRouter& gateway);

}  // namespace chs::api
