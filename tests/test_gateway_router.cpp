#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "app/GatewayRouter.hpp"
#include "app/ShardTable.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "support/TestDoubles.hpp"

namespace {

using testing::ScriptedTransport;

std::vector<domain::ShardDescriptor> threeShards() {
    std::vector<domain::ShardDescriptor> shards;
    for (domain::ShardId id = 1; id <= 3; ++id) {
        domain::ShardDescriptor shard;
        shard.id = id;
        const auto port = static_cast<std::uint16_t>(4000 + id);
        shard.endpoints.push_back({"s" + std::to_string(id), port});
        shard.endpoints.push_back({"s" + std::to_string(id) + "b", port});
        shards.push_back(shard);
    }
    return shards;
}

std::string messageJson(const std::string& id, const std::string& from, const std::string& to, int createdAt) {
    return R"({"id":")" + id + R"(","from_user_id":")" + from + R"(","to_user_id":")" + to
           + R"(","content":"hello","created_at":)" + std::to_string(createdAt) + R"(,"shard_id":1})";
}

std::string conversationBody(const std::vector<std::string>& messages) {
    std::string body = R"({"messages":[)";
    for (std::size_t i = 0; i < messages.size(); ++i) {
        if (i > 0) {
            body += ',';
        }
        body += messages[i];
    }
    return body + "]}";
}

domain::TimestampMs fixedNow() {
    return 1000;
}

std::uint64_t counter(const char* name) {
    return chs::common::metrics::Registry::instance().counter(name);
}

}  // namespace

int main() {
    using namespace std::chrono_literals;

    // Primary unreachable: the backup answers and the shard stays healthy.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        transport.on("s1:4001", ScriptedTransport::unreachable());
        transport.on("s1b:4001", ScriptedTransport::respond(200, R"({"messages":[]})"));
        app::GatewayRouter router(table, transport, 100ms, fixedNow);

        const auto failuresBefore = counter("shard.attempt.fail");
        const auto reply = router.messagesFor("4", 20);
        if (reply.response.status != 200 || reply.endpoint.host != "s1b" || reply.shardId != 1) {
            std::cerr << "Expected backup s1b of shard 1 to answer, got " << reply.endpoint.host << "\n";
            return 1;
        }
        const auto calls = transport.calls();
        if (calls.size() != 2 || calls[0] != "GET s1:4001/api/messages/4?limit=20"
            || calls[1] != "GET s1b:4001/api/messages/4?limit=20") {
            std::cerr << "Unexpected call sequence for failover\n";
            return 1;
        }
        if (table.descriptor(1).health != domain::ShardHealth::Healthy) {
            std::cerr << "Expected shard 1 healthy after backup success\n";
            return 1;
        }
        if (counter("shard.attempt.fail") != failuresBefore + 1) {
            std::cerr << "Expected one failed attempt to be counted\n";
            return 1;
        }
    }

    // 5xx moves on; 4xx is a successful contact passed through unchanged.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        transport.on("s2:4002", ScriptedTransport::respond(503, R"({"error":"down"})"));
        transport.on("s2b:4002", ScriptedTransport::respond(400, R"({"error":"validation_failed"})"));
        app::GatewayRouter router(table, transport, 100ms, fixedNow);

        const auto reply = router.sendMessage("2", R"({"from_user_id":"2","to_user_id":"3","content":"x"})");
        if (reply.response.status != 400 || reply.response.body != R"({"error":"validation_failed"})") {
            std::cerr << "Expected 400 from backup to pass through, got " << reply.response.status << "\n";
            return 1;
        }
        if (transport.calls().back() != "POST s2b:4002/api/messages") {
            std::cerr << "Expected POST to land on s2b\n";
            return 1;
        }
        if (table.descriptor(2).consecutiveFailures != 0) {
            std::cerr << "Expected 4xx to count as success\n";
            return 1;
        }
    }

    // Every endpoint down: 503 error and the shard is marked unhealthy.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        app::GatewayRouter router(table, transport, 100ms, fixedNow);

        const auto unavailableBefore = counter("shard.unavailable");
        try {
            router.messagesFor("3", std::nullopt);
            std::cerr << "Expected ServiceUnavailableError when all endpoints fail\n";
            return 1;
        } catch (const domain::ServiceUnavailableError&) {
        }
        const auto shard = table.descriptor(3);
        if (shard.health != domain::ShardHealth::Unhealthy || shard.consecutiveFailures != 1
            || shard.lastCheckedMs != domain::TimestampMs{1000}) {
            std::cerr << "Expected shard 3 unhealthy with one failure stamped at 1000\n";
            return 1;
        }
        if (counter("shard.unavailable") != unavailableBefore + 1) {
            std::cerr << "Expected shard.unavailable to be counted\n";
            return 1;
        }
        if (transport.calls().front() != "GET s3:4003/api/messages/3") {
            std::cerr << "Expected no limit parameter when none was given\n";
            return 1;
        }
    }

    // Cross-shard conversation merges both sides in time order.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        transport.on("s1:4001", ScriptedTransport::respond(200, conversationBody({
            messageJson("m1", "1", "2", 10), messageJson("m3", "1", "2", 30)})));
        transport.on("s2:4002", ScriptedTransport::respond(200, conversationBody({
            messageJson("m2", "2", "1", 20), messageJson("dup", "1", "2", 30)})));
        app::GatewayRouter router(table, transport, 100ms, fixedNow);

        const auto result = router.conversation("1", "2", 50);
        if (result.messages.size() != 3 || result.messages[0].id != "m1" || result.messages[1].id != "m2"
            || result.messages[2].id != "m3") {
            std::cerr << "Expected merged conversation m1,m2,m3 (" << result.messages.size() << " messages)\n";
            return 1;
        }
        if (result.shardsQueried != std::vector<domain::ShardId>{1, 2} || !result.shardsFailed.empty()) {
            std::cerr << "Expected shards 1 and 2 queried without failures\n";
            return 1;
        }
    }

    // One side of the conversation unreachable: partial result plus shards_failed.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        transport.on("s1:4001", ScriptedTransport::respond(200, conversationBody({messageJson("m1", "1", "2", 10)})));
        app::GatewayRouter router(table, transport, 100ms, fixedNow);

        const auto result = router.conversation("1", "2", std::nullopt);
        if (result.messages.size() != 1 || result.shardsFailed != std::vector<domain::ShardId>{2}) {
            std::cerr << "Expected partial conversation with shard 2 failed\n";
            return 1;
        }
        if (table.descriptor(2).health != domain::ShardHealth::Unhealthy) {
            std::cerr << "Expected shard 2 unhealthy after failed sub-query\n";
            return 1;
        }
    }

    // Same-shard conversation issues a single query.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        transport.on("s1:4001", ScriptedTransport::respond(200, conversationBody({})));
        app::GatewayRouter router(table, transport, 100ms, fixedNow);

        const auto result = router.conversation("1", "4", std::nullopt);
        if (result.shardsQueried != std::vector<domain::ShardId>{1} || transport.calls().size() != 1) {
            std::cerr << "Expected a single query for users on the same shard\n";
            return 1;
        }
    }

    // Fan-out: failing shard contributes nothing, order follows shard ids.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        transport.on("s1:4001", ScriptedTransport::respond(200, R"({"users":[{"id":1,"name":"ana","shard_id":1}]})"));
        transport.on("s3:4003", ScriptedTransport::respond(200, R"({"users":[{"id":3,"name":"","shard_id":3}]})"));
        app::GatewayRouter router(table, transport, 100ms, fixedNow);

        const auto users = router.listUsers();
        if (users.size() != 2 || users[0].id != 1 || users[1].id != 3 || users[0].name != "ana") {
            std::cerr << "Expected users 1 and 3 from the reachable shards\n";
            return 1;
        }
    }

    // Probe reports per endpoint without touching the health table.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        transport.on("s1:4001", ScriptedTransport::respond(200, R"({"status":"ok"})"));
        transport.on("s2b:4002", ScriptedTransport::respond(500, "{}"));
        app::GatewayRouter router(table, transport, 100ms, fixedNow);

        const auto probes = router.probe();
        if (probes.size() != 3 || probes[0].endpoints.size() != 2) {
            std::cerr << "Expected 3 shards with 2 endpoints each in probe\n";
            return 1;
        }
        if (!probes[0].endpoints[0].reachable || probes[0].endpoints[1].reachable
            || probes[0].endpoints[1].error.empty()) {
            std::cerr << "Expected s1 reachable and s1b unreachable with an error\n";
            return 1;
        }
        if (probes[1].endpoints[1].reachable || probes[1].endpoints[1].status != 500U) {
            std::cerr << "Expected s2b reported with status 500\n";
            return 1;
        }
        for (const auto& shard : router.health()) {
            if (shard.lastCheckedMs || shard.consecutiveFailures != 0) {
                std::cerr << "Expected probe to leave the health table untouched\n";
                return 1;
            }
        }
    }

    // Bad sender id is rejected before any network call.
    {
        app::ShardTable table(threeShards());
        ScriptedTransport transport;
        app::GatewayRouter router(table, transport, 100ms, fixedNow);
        try {
            router.sendMessage("abc", "{}");
            std::cerr << "Expected ValidationError for non-numeric sender\n";
            return 1;
        } catch (const domain::ValidationError&) {
        }
        if (!transport.calls().empty()) {
            std::cerr << "Expected no transport call for invalid sender\n";
            return 1;
        }
    }

    std::cout << "test_gateway_router passed\n";
    return 0;
}
