#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <utility>

#include "api/GatewayController.hpp"
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "app/GatewayRouter.hpp"
#include "app/ShardTable.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Process.hpp"
#include "infra/http/BeastShardTransport.hpp"

int main(int argc, char** argv) {
    chs::common::installTerminateHandler();

    try {
        auto config = chs::common::GatewayConfig::fromArgs(argc, argv);
        chs::log::setLevel(config.logLevel);

        LOG_INFO("[GATEWAY] configuration loaded");
        LOG_INFO("[GATEWAY]   port: " << config.port);
        LOG_INFO("[GATEWAY]   log level: " << chs::log::levelToString(config.logLevel));
        LOG_INFO("[GATEWAY]   worker threads: " << config.threads);
        LOG_INFO("[GATEWAY]   shard timeout: " << config.shardTimeoutMs << " ms");
        for (const auto& shard : config.shards) {
            for (std::size_t i = 0; i < shard.endpoints.size(); ++i) {
                LOG_INFO("[GATEWAY]   shard " << shard.id << (i == 0 ? " primary " : " backup ")
                                              << shard.endpoints[i].toString());
            }
        }

        app::ShardTable table(config.shards);
        infra::http::BeastShardTransport transport;
        app::GatewayRouter gateway(table, transport, std::chrono::milliseconds(config.shardTimeoutMs));

        chs::api::Router router;
        chs::api::registerGatewayRoutes(router, gateway);

        chs::api::HttpServer server(chs::api::Endpoint{"0.0.0.0", config.port}, config.threads, router);

        chs::api::HttpServer::CorsConfig corsConfig{};
        corsConfig.enabled = config.httpCorsEnable && !config.httpCorsOrigin.empty();
        corsConfig.origin = config.httpCorsOrigin;
        server.setCorsConfig(std::move(corsConfig));

        server.start();
        LOG_INFO("[GATEWAY] listening on port " << config.port << " for " << table.shardCount() << " shards");

        const auto signal = chs::common::waitForShutdownSignal();
        LOG_INFO("[GATEWAY] signal " << signal << " received, starting graceful shutdown");

        server.stop();
        server.wait();

        LOG_INFO("[GATEWAY] shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR("[GATEWAY] fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
