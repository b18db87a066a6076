#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "domain/ShardMap.hpp"

namespace chs::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> split(const std::string& value, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::uint16_t parsePort(const std::string& value) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: " + value);
    }
}

std::size_t parseThreads(const std::string& value) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U) {
            throw std::out_of_range("threads must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid thread count: " + value);
    }
}

std::uint32_t parsePositive(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("value out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

domain::ShardId parseShardId(const std::string& value, const std::string& label) {
    const auto parsed = parsePositive(value, label);
    if (parsed > domain::kMaxShardCount) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return static_cast<domain::ShardId>(parsed);
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
}

domain::Endpoint parseEndpoint(const std::string& value) {
    const auto colonPos = value.rfind(':');
    if (colonPos == std::string::npos || colonPos == 0U || colonPos + 1 == value.size()) {
        throw std::runtime_error("Invalid endpoint (expected host:port): " + value);
    }
    return domain::Endpoint{value.substr(0, colonPos), parsePort(value.substr(colonPos + 1))};
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? trim(value) : std::string{};
}

void ensureParentDirectory(const std::string& path) {
    const std::filesystem::path dbPath{path};
    const auto parentDir = dbPath.parent_path();
    if (parentDir.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
        throw std::runtime_error("Unable to create database directory (" + parentDir.string() + "): " +
                                 ec.message());
    }
}

}  // namespace

std::vector<domain::ShardDescriptor> GatewayConfig::defaultShards() {
    std::vector<domain::ShardDescriptor> shards;
    for (domain::ShardId id = 1; id <= 3; ++id) {
        const auto port = static_cast<std::uint16_t>(4000 + id);
        domain::ShardDescriptor shard{};
        shard.id = id;
        shard.endpoints.push_back({"shard-" + std::to_string(id), port});
        shard.endpoints.push_back({"shard-" + std::to_string(id) + "-backup", port});
        shards.push_back(std::move(shard));
    }
    return shards;
}

std::vector<domain::ShardDescriptor> GatewayConfig::parseShards(const std::string& value) {
    std::vector<domain::ShardDescriptor> shards;
    for (const auto& entry : split(value, ',')) {
        const auto eqPos = entry.find('=');
        if (eqPos == std::string::npos) {
            throw std::runtime_error("Invalid shard entry (expected id=host:port|...): " + entry);
        }

        domain::ShardDescriptor shard{};
        shard.id = parseShardId(trim(entry.substr(0, eqPos)), "shard id");
        for (const auto& endpoint : split(entry.substr(eqPos + 1), '|')) {
            shard.endpoints.push_back(parseEndpoint(endpoint));
        }
        if (shard.endpoints.empty()) {
            throw std::runtime_error("Shard " + std::to_string(shard.id) + " has no endpoints");
        }
        shards.push_back(std::move(shard));
    }

    if (shards.empty()) {
        throw std::runtime_error("Shard list is empty");
    }

    std::sort(shards.begin(), shards.end(), [](const auto& lhs, const auto& rhs) { return lhs.id < rhs.id; });
    for (std::size_t i = 0; i < shards.size(); ++i) {
        if (shards[i].id != static_cast<domain::ShardId>(i + 1)) {
            throw std::runtime_error("Shard ids must be contiguous starting at 1");
        }
    }
    return shards;
}

GatewayConfig GatewayConfig::fromArgs(int argc, char** argv) {
    GatewayConfig config{};

    if (auto envPort = envOrEmpty("PORT"); !envPort.empty()) {
        config.port = parsePort(envPort);
    }
    if (auto envLevel = envOrEmpty("LOG_LEVEL"); !envLevel.empty()) {
        config.logLevel = chs::log::levelFromString(envLevel);
    }
    if (auto envShards = envOrEmpty("SHARDS"); !envShards.empty()) {
        config.shards = parseShards(envShards);
    }
    if (auto envTimeout = envOrEmpty("SHARD_TIMEOUT_MS"); !envTimeout.empty()) {
        config.shardTimeoutMs = parsePositive(envTimeout, "SHARD_TIMEOUT_MS");
    }

    if (auto portArg = valueFromArgs(argc, argv, "--port"); !portArg.empty()) {
        config.port = parsePort(portArg);
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = chs::log::levelFromString(levelArg);
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.threads = parseThreads(threadsArg);
    }
    if (auto shardsArg = valueFromArgs(argc, argv, "--shards"); !shardsArg.empty()) {
        config.shards = parseShards(shardsArg);
    }
    if (auto timeoutArg = valueFromArgs(argc, argv, "--shard-timeout-ms"); !timeoutArg.empty()) {
        config.shardTimeoutMs = parsePositive(timeoutArg, "--shard-timeout-ms");
    }
    if (auto corsEnableArg = valueFromArgs(argc, argv, "--http.cors.enable"); !corsEnableArg.empty()) {
        config.httpCorsEnable = parseBool(corsEnableArg);
    }
    if (auto corsOriginArg = valueFromArgs(argc, argv, "--http.cors.origin"); !corsOriginArg.empty()) {
        config.httpCorsOrigin = trim(corsOriginArg);
    }

    return config;
}

ShardNodeConfig ShardNodeConfig::fromArgs(int argc, char** argv) {
    ShardNodeConfig config{};

    if (auto envShardId = envOrEmpty("SHARD_ID"); !envShardId.empty()) {
        config.shardId = parseShardId(envShardId, "SHARD_ID");
    }
    if (auto envShardCount = envOrEmpty("SHARD_COUNT"); !envShardCount.empty()) {
        config.shardCount = parsePositive(envShardCount, "SHARD_COUNT");
    }
    if (auto envPort = envOrEmpty("PORT"); !envPort.empty()) {
        config.port = parsePort(envPort);
    }
    if (auto envLevel = envOrEmpty("LOG_LEVEL"); !envLevel.empty()) {
        config.logLevel = chs::log::levelFromString(envLevel);
    }
    if (auto envDb = envOrEmpty("DB_PATH"); !envDb.empty()) {
        config.dbPath = envDb;
    }
    if (auto envReplica = envOrEmpty("REPLICA_ENDPOINT"); !envReplica.empty()) {
        config.replicaEndpoint = parseEndpoint(envReplica);
    }

    if (auto idArg = valueFromArgs(argc, argv, "--shard-id"); !idArg.empty()) {
        config.shardId = parseShardId(idArg, "--shard-id");
    }
    if (auto countArg = valueFromArgs(argc, argv, "--shard-count"); !countArg.empty()) {
        config.shardCount = parsePositive(countArg, "--shard-count");
    }
    if (auto portArg = valueFromArgs(argc, argv, "--port"); !portArg.empty()) {
        config.port = parsePort(portArg);
    }
    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = chs::log::levelFromString(levelArg);
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.threads = parseThreads(threadsArg);
    }
    if (auto dbArg = valueFromArgs(argc, argv, "--db"); !dbArg.empty()) {
        config.dbPath = trim(dbArg);
    }
    if (auto replicaArg = valueFromArgs(argc, argv, "--replica"); !replicaArg.empty()) {
        config.replicaEndpoint = parseEndpoint(trim(replicaArg));
    }
    if (auto replicaTimeoutArg = valueFromArgs(argc, argv, "--replica-timeout-ms"); !replicaTimeoutArg.empty()) {
        config.replicaTimeoutMs = parsePositive(replicaTimeoutArg, "--replica-timeout-ms");
    }
    if (auto ttlArg = valueFromArgs(argc, argv, "--cache-ttl-s"); !ttlArg.empty()) {
        config.cacheTtlSeconds = parsePositive(ttlArg, "--cache-ttl-s");
    }
    if (auto replicationArg = valueFromArgs(argc, argv, "--replication"); !replicationArg.empty()) {
        config.replication = parseBool(replicationArg);
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--replication-interval-ms"); !intervalArg.empty()) {
        config.replicationIntervalMs = parsePositive(intervalArg, "--replication-interval-ms");
    }
    if (auto windowArg = valueFromArgs(argc, argv, "--replication-window-ms"); !windowArg.empty()) {
        config.replicationWindowMs = parsePositive(windowArg, "--replication-window-ms");
    }
    if (auto retryArg = valueFromArgs(argc, argv, "--replication-retry-ms"); !retryArg.empty()) {
        config.replicationRetryMs = parsePositive(retryArg, "--replication-retry-ms");
    }
    if (auto maxLimitArg = valueFromArgs(argc, argv, "--http-max-limit"); !maxLimitArg.empty()) {
        config.httpMaxLimit = static_cast<std::int32_t>(
            std::min<std::uint32_t>(parsePositive(maxLimitArg, "--http-max-limit"),
                                    static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max())));
    }
    if (auto pingArg = valueFromArgs(argc, argv, "--ws-ping-period-ms"); !pingArg.empty()) {
        config.wsPingPeriodMs = parsePositive(pingArg, "--ws-ping-period-ms");
    }
    if (auto pongArg = valueFromArgs(argc, argv, "--ws-pong-timeout-ms"); !pongArg.empty()) {
        config.wsPongTimeoutMs = parsePositive(pongArg, "--ws-pong-timeout-ms");
    }
    if (auto queueMsgsArg = valueFromArgs(argc, argv, "--ws-queue-max-msgs"); !queueMsgsArg.empty()) {
        config.wsQueueMaxMessages = parsePositive(queueMsgsArg, "--ws-queue-max-msgs");
    }
    if (auto queueBytesArg = valueFromArgs(argc, argv, "--ws-queue-max-bytes"); !queueBytesArg.empty()) {
        config.wsQueueMaxBytes = parsePositive(queueBytesArg, "--ws-queue-max-bytes");
    }
    if (auto stallArg = valueFromArgs(argc, argv, "--ws-stall-timeout-ms"); !stallArg.empty()) {
        config.wsStallTimeoutMs = parsePositive(stallArg, "--ws-stall-timeout-ms");
    }
    if (auto corsEnableArg = valueFromArgs(argc, argv, "--http.cors.enable"); !corsEnableArg.empty()) {
        config.httpCorsEnable = parseBool(corsEnableArg);
    }
    if (auto corsOriginArg = valueFromArgs(argc, argv, "--http.cors.origin"); !corsOriginArg.empty()) {
        config.httpCorsOrigin = trim(corsOriginArg);
    }

    if (config.shardCount > domain::kMaxShardCount) {
        throw std::runtime_error("Shard count " + std::to_string(config.shardCount) + " exceeds "
                                 + std::to_string(domain::kMaxShardCount));
    }
    if (config.shardId > static_cast<domain::ShardId>(config.shardCount)) {
        throw std::runtime_error("Shard id " + std::to_string(config.shardId) + " exceeds shard count " +
                                 std::to_string(config.shardCount));
    }
    if (config.replicaEndpoint && config.replicaEndpoint->port == config.port
        && (config.replicaEndpoint->host == "localhost" || config.replicaEndpoint->host == "127.0.0.1")) {
        throw std::runtime_error("Replica endpoint " + config.replicaEndpoint->toString() + " points at this node");
    }

    ensureParentDirectory(config.dbPath);

    LOG_INFO("[SHARD-" << config.shardId << "] db: " << config.dbPath << " replica: "
                       << (config.replicaEndpoint ? config.replicaEndpoint->toString() : std::string{"none"}));

    return config;
}

}  // namespace chs::common
