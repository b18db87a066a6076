#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"

namespace {

// Restores an environment variable on scope exit.
struct EnvGuard {
    explicit EnvGuard(std::string variable) : name(std::move(variable)) {
        const char* current = std::getenv(name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

std::vector<char*> argvOf(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return argv;
}

chs::common::ShardNodeConfig runShardConfig(const std::vector<std::string>& args) {
    auto argv = argvOf(args);
    return chs::common::ShardNodeConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

chs::common::GatewayConfig runGatewayConfig(const std::vector<std::string>& args) {
    auto argv = argvOf(args);
    return chs::common::GatewayConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

template <typename Fn>
bool throwsRuntime(Fn&& fn) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard dbGuard("DB_PATH");
    EnvGuard replicaGuard("REPLICA_ENDPOINT");
    EnvGuard shardIdGuard("SHARD_ID");
    EnvGuard shardCountGuard("SHARD_COUNT");
    EnvGuard portGuard("PORT");
    EnvGuard levelGuard("LOG_LEVEL");
    EnvGuard shardsGuard("SHARDS");
    for (auto* guard : {&dbGuard, &replicaGuard, &shardIdGuard, &shardCountGuard, &portGuard, &levelGuard, &shardsGuard}) {
        guard->clear();
    }

    const std::filesystem::path root = std::filesystem::temp_directory_path() / "chatshard-config-test";
    std::filesystem::remove_all(root);
    const std::string flagPath = (root / "flag" / "shard.duckdb").string();
    const std::string envPath = (root / "env" / "shard.duckdb").string();

    // Defaults apart from the database path.
    auto defaults = runShardConfig({"shard", "--db", flagPath});
    if (defaults.shardId != 1 || defaults.shardCount != 3 || defaults.port != 4001 || defaults.threads != 4
        || defaults.cacheTtlSeconds != 300 || !defaults.replication || defaults.replicationIntervalMs != 5000
        || defaults.replicationWindowMs != 60000 || defaults.httpMaxLimit != 1000 || defaults.replicaEndpoint
        || defaults.replicaTimeoutMs != 5000 || defaults.wsQueueMaxMessages != 500
        || defaults.wsQueueMaxBytes != 15U * 1024U * 1024U || defaults.wsStallTimeoutMs != 20000) {
        std::cerr << "Unexpected shard node defaults\n";
        return 1;
    }
    if (!std::filesystem::exists(root / "flag")) {
        std::cerr << "Expected parent directory of the database path to be created\n";
        return 1;
    }

    // Environment overrides defaults; flags override environment.
    dbGuard.set(envPath);
    shardIdGuard.set("2");
    shardCountGuard.set("4");
    replicaGuard.set("shard-2-backup:4102");
    auto fromEnv = runShardConfig({"shard"});
    if (fromEnv.dbPath != envPath || fromEnv.shardId != 2 || fromEnv.shardCount != 4 || !fromEnv.replicaEndpoint
        || fromEnv.replicaEndpoint->host != "shard-2-backup" || fromEnv.replicaEndpoint->port != 4102) {
        std::cerr << "Expected env values, got db=" << fromEnv.dbPath << " shard=" << fromEnv.shardId << "\n";
        return 1;
    }
    auto fromFlags = runShardConfig({"shard", "--db", flagPath, "--shard-id=3", "--replication=false",
                                     "--http-max-limit", "200", "--log-level", "debug", "--replica", "standby:4203",
                                     "--replica-timeout-ms=750", "--ws-queue-max-msgs", "16",
                                     "--ws-queue-max-bytes=65536", "--ws-stall-timeout-ms", "1500"});
    if (fromFlags.dbPath != flagPath || fromFlags.shardId != 3 || fromFlags.replication
        || fromFlags.httpMaxLimit != 200 || fromFlags.logLevel != chs::log::Level::Debug
        || fromFlags.replicaEndpoint->host != "standby" || fromFlags.replicaEndpoint->port != 4203
        || fromFlags.replicaTimeoutMs != 750 || fromFlags.wsQueueMaxMessages != 16
        || fromFlags.wsQueueMaxBytes != 65536 || fromFlags.wsStallTimeoutMs != 1500) {
        std::cerr << "Expected flags to override the environment\n";
        return 1;
    }
    dbGuard.clear();
    shardIdGuard.clear();
    shardCountGuard.clear();
    replicaGuard.clear();

    if (!throwsRuntime([&]() { runShardConfig({"shard", "--db", flagPath, "--replica", "127.0.0.1:4001"}); })
        || !throwsRuntime([&]() {
               runShardConfig({"shard", "--db", flagPath, "--port", "4100", "--replica", "localhost:4100"});
           })) {
        std::cerr << "Expected a replica endpoint pointing at this node to be rejected\n";
        return 1;
    }
    if (!throwsRuntime([&]() { runShardConfig({"shard", "--db", flagPath, "--replica", "standby"}); })) {
        std::cerr << "Expected a replica endpoint without a port to be rejected\n";
        return 1;
    }
    if (!throwsRuntime([&]() { runShardConfig({"shard", "--db", flagPath, "--shard-id", "4"}); })) {
        std::cerr << "Expected shard id beyond the shard count to be rejected\n";
        return 1;
    }
    if (!throwsRuntime([&]() { runShardConfig({"shard", "--db", flagPath, "--shard-count", "3000000000"}); })
        || !throwsRuntime([&]() {
               runShardConfig({"shard", "--db", flagPath, "--shard-count", "3", "--shard-id", "4294967295"});
           })) {
        std::cerr << "Expected shard counts and ids above INT32_MAX to be rejected\n";
        return 1;
    }
    if (!throwsRuntime([&]() { runShardConfig({"shard", "--db", flagPath, "--ws-queue-max-msgs", "0"}); })) {
        std::cerr << "Expected a zero send queue limit to be rejected\n";
        return 1;
    }

    // Gateway shard table.
    auto gatewayDefaults = runGatewayConfig({"gateway"});
    if (gatewayDefaults.port != 3000 || gatewayDefaults.shards.size() != 3
        || gatewayDefaults.shards[1].endpoints.size() != 2 || gatewayDefaults.shards[1].endpoints[0].host != "shard-2"
        || gatewayDefaults.shards[1].endpoints[1].host != "shard-2-backup"
        || gatewayDefaults.shards[1].endpoints[0].port != 4002 || gatewayDefaults.shardTimeoutMs != 5000) {
        std::cerr << "Unexpected gateway defaults\n";
        return 1;
    }

    shardsGuard.set("2=b:5002,1=a:5001|a2:5011");
    auto gatewayEnv = runGatewayConfig({"gateway", "--port", "8080", "--shard-timeout-ms=250"});
    if (gatewayEnv.port != 8080 || gatewayEnv.shardTimeoutMs != 250 || gatewayEnv.shards.size() != 2
        || gatewayEnv.shards[0].id != 1 || gatewayEnv.shards[0].endpoints.size() != 2
        || gatewayEnv.shards[0].endpoints[1].host != "a2" || gatewayEnv.shards[1].endpoints[0].port != 5002) {
        std::cerr << "Expected SHARDS to be parsed and sorted by id\n";
        return 1;
    }
    shardsGuard.clear();

    for (const char* bad : {"1=a:5001,3=c:5003", "1=a", "1=a:notaport", "x=a:1", "", "3000000000=a:5001"}) {
        if (!throwsRuntime([bad]() { chs::common::GatewayConfig::parseShards(bad); })) {
            std::cerr << "Expected shard list to be rejected: '" << bad << "'\n";
            return 1;
        }
    }

    std::filesystem::remove_all(root);
    std::cout << "test_config passed\n";
    return 0;
}
