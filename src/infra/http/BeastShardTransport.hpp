#pragma once

#include <chrono>
#include <string>

#include "domain/Ports.hpp"

namespace infra::http {

// Synchronous HTTP/1.1 client over plain TCP, one connection per request.
// Every phase (connect, write, read) shares the per-call deadline.
class BeastShardTransport final : public domain::contracts::IShardTransport {
public:
    domain::contracts::TransportResponse get(const domain::Endpoint& endpoint,
                                             const std::string& target,
                                             std::chrono::milliseconds timeout) override;

    domain::contracts::TransportResponse post(const domain::Endpoint& endpoint,
                                              const std::string& target,
                                              const std::string& jsonBody,
                                              std::chrono::milliseconds timeout) override;
};

}  // namespace infra::http
