#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "api/ShardController.hpp"
#include "app/ConnectionRegistry.hpp"
#include "app/GatewayRouter.hpp"
#include "app/MessageService.hpp"
#include "app/ReplicationManager.hpp"
#include "app/ShardTable.hpp"
#include "domain/Errors.hpp"
#include "infra/http/BeastShardTransport.hpp"
#include "infra/http/HttpReplicaTarget.hpp"
#include "support/TestDoubles.hpp"

namespace {

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

// Loopback socket bound to an ephemeral port. With listen() the kernel
// completes handshakes into the backlog but nobody ever accepts or answers.
struct LoopbackSocket {
    int fd{-1};
    std::uint16_t port{0};

    explicit LoopbackSocket(bool listening) {
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (fd < 0 || ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            return;
        }
        socklen_t length = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &length) == 0) {
            port = ntohs(addr.sin_port);
        }
        if (listening) {
            ::listen(fd, 16);
        }
    }

    ~LoopbackSocket() { release(); }

    void release() {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

domain::Endpoint loopback(std::uint16_t port) { return domain::Endpoint{"127.0.0.1", port}; }

template <typename Fn>
bool throwsTransportErrorWithin(Fn&& call, std::chrono::milliseconds bound, const char* what) {
    const auto started = Clock::now();
    try {
        call();
        std::cerr << what << ": expected TransportError\n";
        return false;
    }
    catch (const domain::TransportError&) {
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    if (elapsed > bound) {
        std::cerr << what << ": took " << elapsed.count() << "ms\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    // Standby shard node on an ephemeral loopback port.
    testing::InMemoryMessageStore standbyStore;
    testing::FlakyCache standbyCache;
    app::ConnectionRegistry standbyRegistry;
    app::MessageService standbyService(standbyStore, standbyCache, standbyRegistry,
                                       app::MessageService::Options{1, 1, 300s});
    chs::api::Router standbyRouter;
    chs::api::registerShardRoutes(standbyRouter, standbyService, chs::api::ShardRouteOptions{});
    chs::api::HttpServer standby(chs::api::Endpoint{"127.0.0.1", 0}, 2, standbyRouter);
    standby.start();
    if (standby.port() == 0) {
        std::cerr << "Expected the standby to report its bound port\n";
        return 1;
    }

    LoopbackSocket stalled(true);
    LoopbackSocket refused(false);
    refused.release();
    if (stalled.port == 0 || refused.port == 0) {
        std::cerr << "Failed to reserve loopback ports\n";
        return 1;
    }

    infra::http::BeastShardTransport transport;

    // Plain request/response against a live node.
    {
        const auto health = transport.get(loopback(standby.port()), "/health", 1000ms);
        if (health.status != 200 || boost::json::parse(health.body).as_object().at("status") != "ok") {
            std::cerr << "Expected 200 from /health, got " << health.status << " " << health.body << "\n";
            return 1;
        }

        const auto created = transport.post(loopback(standby.port()), "/api/messages",
                                            R"({"from_user_id":"1","to_user_id":"2","content":"over tcp"})", 1000ms);
        if (created.status != 200 || standbyStore.messageCount() != 1) {
            std::cerr << "Expected message stored through POST, got " << created.status << " " << created.body << "\n";
            return 1;
        }

        const auto rejected = transport.post(loopback(standby.port()), "/api/messages", R"({"content":"x"})", 1000ms);
        if (rejected.status != 400) {
            std::cerr << "Expected 400 passed through, got " << rejected.status << "\n";
            return 1;
        }
    }

    // A peer that accepts the connection but never answers hits the deadline.
    if (!throwsTransportErrorWithin([&]() { transport.get(loopback(stalled.port), "/health", 200ms); }, 1500ms,
                                    "stalled GET")
        || !throwsTransportErrorWithin(
            [&]() { transport.post(loopback(stalled.port), "/api/messages", "{}", 200ms); }, 1500ms, "stalled POST")
        || !throwsTransportErrorWithin([&]() { transport.get(loopback(refused.port), "/health", 200ms); }, 1500ms,
                                       "refused connection")) {
        return 1;
    }

    // Gateway failover: a stalled primary times out and the backup answers.
    {
        domain::ShardDescriptor shard;
        shard.id = 1;
        shard.endpoints = {loopback(stalled.port), loopback(standby.port())};
        app::ShardTable table({shard});
        app::GatewayRouter gateway(table, transport, 300ms);

        const auto started = Clock::now();
        const auto reply = gateway.messagesFor("1", std::nullopt);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        if (reply.response.status != 200 || !(reply.endpoint == loopback(standby.port()))) {
            std::cerr << "Expected the backup endpoint to answer, got " << reply.response.status << " from "
                      << reply.endpoint.toString() << "\n";
            return 1;
        }
        if (elapsed > 2000ms) {
            std::cerr << "Failover took " << elapsed.count() << "ms\n";
            return 1;
        }
        const auto messages = boost::json::parse(reply.response.body).as_object().at("messages").as_array();
        if (messages.size() != 1 || messages[0].as_object().at("content") != "over tcp") {
            std::cerr << "Expected the stored message from the backup, got " << reply.response.body << "\n";
            return 1;
        }
        if (table.descriptor(1).health != domain::ShardHealth::Healthy) {
            std::cerr << "Expected shard to stay healthy when the backup answers\n";
            return 1;
        }
    }

    // Primary to standby replication over HTTP, then read back through failover.
    {
        testing::InMemoryMessageStore primary;
        primary.users.push_back(domain::UserRecord{5, "eve", 1});
        primary.messages.push_back(domain::Message{"p1", "5", "9", "replicated", 1000, 1});

        infra::http::HttpReplicaTarget replica(transport, loopback(standby.port()), 1000ms);
        replica.ping();

        app::ReplicationManager::Options options;
        options.shardId = 1;
        app::ReplicationManager manager(primary, replica, options, []() { return 2000; });
        const auto result = manager.tick();
        if (result.messages != 1 || result.users != 1 || standbyStore.messageCount() != 2) {
            std::cerr << "Expected one message replicated to the standby\n";
            return 1;
        }

        domain::ShardDescriptor shard;
        shard.id = 1;
        shard.endpoints = {loopback(stalled.port), loopback(standby.port())};
        app::ShardTable table({shard});
        app::GatewayRouter gateway(table, transport, 300ms);
        const auto reply = gateway.get(1, "/api/conversations/9/5");
        const auto messages = boost::json::parse(reply.response.body).as_object().at("messages").as_array();
        if (reply.response.status != 200 || messages.size() != 1
            || messages[0].as_object().at("content") != "replicated") {
            std::cerr << "Expected replicated message served by the standby, got " << reply.response.body << "\n";
            return 1;
        }

        infra::http::HttpReplicaTarget unreachable(transport, loopback(stalled.port), 200ms);
        if (!throwsTransportErrorWithin([&]() { unreachable.ping(); }, 1500ms, "replica ping")) {
            return 1;
        }
        app::ReplicationManager stuck(primary, unreachable, options, []() { return 2000; });
        if (!throwsTransportErrorWithin([&]() { stuck.tick(); }, 1500ms, "tick against a silent standby")
            || stuck.highWaterMark().has_value()) {
            std::cerr << "Expected a failed tick to leave the high-water mark unset\n";
            return 1;
        }
    }

    standby.stop();
    std::cout << "test_shard_transport passed\n";
    return 0;
}
