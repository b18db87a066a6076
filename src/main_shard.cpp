#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "adapters/cache/TtlCache.hpp"
#include "adapters/duckdb/DuckMessageStore.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "api/ShardController.hpp"
#include "api/WebSocketServer.hpp"
#include "app/ConnectionRegistry.hpp"
#include "app/MessageService.hpp"
#include "app/PushProtocol.hpp"
#include "app/ReplicationManager.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Process.hpp"
#include "infra/http/BeastShardTransport.hpp"
#include "infra/http/HttpReplicaTarget.hpp"

int main(int argc, char** argv) {
    chs::common::installTerminateHandler();

    try {
        auto config = chs::common::ShardNodeConfig::fromArgs(argc, argv);
        chs::log::setLevel(config.logLevel);

        LOG_INFO("[SHARD-" << config.shardId << "] configuration loaded");
        LOG_INFO("[SHARD-" << config.shardId << "]   port: " << config.port);
        LOG_INFO("[SHARD-" << config.shardId << "]   shard count: " << config.shardCount);
        LOG_INFO("[SHARD-" << config.shardId << "]   worker threads: " << config.threads);
        LOG_INFO("[SHARD-" << config.shardId << "]   cache ttl: " << config.cacheTtlSeconds << " s");
        LOG_INFO("[SHARD-" << config.shardId << "]   http max_limit=" << config.httpMaxLimit);
        LOG_INFO("[SHARD-" << config.shardId << "]   WS ping period: " << config.wsPingPeriodMs << " ms");
        LOG_INFO("[SHARD-" << config.shardId << "]   WS pong timeout: " << config.wsPongTimeoutMs << " ms");
        LOG_INFO("[SHARD-" << config.shardId << "]   WS send queue: " << config.wsQueueMaxMessages << " msgs / "
                           << config.wsQueueMaxBytes << " bytes, stall " << config.wsStallTimeoutMs << " ms");

        adapters::duckdb::DuckStore db(config.dbPath);
        adapters::duckdb::DuckMessageStore store(db);

        adapters::cache::TtlCache cache;
        app::ConnectionRegistry registry;

        app::MessageService::Options serviceOptions;
        serviceOptions.shardId = config.shardId;
        serviceOptions.shardCount = config.shardCount;
        serviceOptions.cacheTtl = std::chrono::seconds(config.cacheTtlSeconds);
        app::MessageService service(store, cache, registry, serviceOptions);
        app::PushProtocol protocol(registry, service);

        chs::api::WebSocketServer websocket("/ws");
        websocket.configureKeepAlive(std::chrono::milliseconds(config.wsPingPeriodMs),
                                     std::chrono::milliseconds(config.wsPongTimeoutMs));
        websocket.configureBackpressure(config.wsQueueMaxMessages, config.wsQueueMaxBytes,
                                        std::chrono::milliseconds(config.wsStallTimeoutMs));
        websocket.setMessageHandler([&protocol](const chs::api::WebSocketServer::SessionPtr& session,
                                                const std::string& text) { protocol.onFrame(session, text); });
        websocket.setCloseHandler(
            [&protocol](const chs::api::WebSocketServer::SessionPtr& session) { protocol.onClosed(*session); });

        chs::api::Router router;
        chs::api::ShardRouteOptions routeOptions;
        routeOptions.maxLimit = static_cast<std::size_t>(config.httpMaxLimit);
        chs::api::registerShardRoutes(router, service, routeOptions);

        chs::api::HttpServer server(chs::api::Endpoint{"0.0.0.0", config.port}, config.threads, router);

        chs::api::HttpServer::CorsConfig corsConfig{};
        corsConfig.enabled = config.httpCorsEnable && !config.httpCorsOrigin.empty();
        corsConfig.origin = config.httpCorsOrigin;
        server.setCorsConfig(std::move(corsConfig));
        server.setUpgradeHandler([&websocket](int clientFd, const chs::api::Request& request) {
            return websocket.handleClient(clientFd, request);
        });

        infra::http::BeastShardTransport replicaTransport;
        std::unique_ptr<infra::http::HttpReplicaTarget> replica;
        std::unique_ptr<app::ReplicationManager> replication;
        if (config.replication && config.replicaEndpoint) {
            replica = std::make_unique<infra::http::HttpReplicaTarget>(
                replicaTransport, *config.replicaEndpoint, std::chrono::milliseconds(config.replicaTimeoutMs));
            app::ReplicationManager::Options replicationOptions;
            replicationOptions.shardId = config.shardId;
            replicationOptions.interval = std::chrono::milliseconds(config.replicationIntervalMs);
            replicationOptions.window = std::chrono::milliseconds(config.replicationWindowMs);
            replicationOptions.retryDelay = std::chrono::milliseconds(config.replicationRetryMs);
            replication = std::make_unique<app::ReplicationManager>(store, *replica, replicationOptions);
            replication->start();
            LOG_INFO("[SHARD-" << config.shardId << "] replicating to " << config.replicaEndpoint->toString());
        } else if (config.replication) {
            LOG_WARN("[SHARD-" << config.shardId << "] no replica endpoint configured, running as standby");
        } else {
            LOG_WARN("[SHARD-" << config.shardId << "] replication disabled");
        }

        server.start();
        LOG_INFO("[SHARD-" << config.shardId << "] listening on port " << config.port);

        const auto signal = chs::common::waitForShutdownSignal();
        LOG_INFO("[SHARD-" << config.shardId << "] signal " << signal << " received, starting graceful shutdown");

        if (replication) {
            replication->stop();
        }

        server.stop();
        server.wait();
        websocket.stop();

        LOG_INFO("[SHARD-" << config.shardId << "] shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR("fatal error in shard node: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
