#pragma once

#include <chrono>
#include <vector>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace infra::http {

// Replication target living in another shard node process (the standby that
// serves the shard's backup endpoint). Batches go to POST /internal/replicate;
// ping is GET /health.
class HttpReplicaTarget final : public domain::contracts::IReplicaTarget {
public:
    static constexpr const char* kReplicatePath = "/internal/replicate";

    HttpReplicaTarget(domain::contracts::IShardTransport& transport,
                      domain::Endpoint endpoint,
                      std::chrono::milliseconds timeout);

    void apply(const std::vector<domain::UserRecord>& users, const std::vector<domain::Message>& messages) override;
    void ping() override;

    const domain::Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    domain::contracts::IShardTransport& transport_;
    domain::Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
};

}  // namespace infra::http
