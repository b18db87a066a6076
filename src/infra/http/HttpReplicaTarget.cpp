#include "infra/http/HttpReplicaTarget.hpp"

#include <cstddef>
#include <string>
#include <utility>

#include <boost/json/object.hpp>

#include "domain/Errors.hpp"
#include "http/HttpJson.hpp"
#include "http/MessageJson.hpp"

namespace infra::http {
namespace {

constexpr std::size_t kMaxErrorBody = 200;

void requireOk(const domain::contracts::TransportResponse& response,
               const domain::Endpoint& endpoint,
               const std::string& what) {
    if (response.status == 200) {
        return;
    }
    throw domain::TransportError("replica " + endpoint.toString() + " rejected " + what + ": status "
                                 + std::to_string(response.status) + " " + response.body.substr(0, kMaxErrorBody));
}

}  // namespace

HttpReplicaTarget::HttpReplicaTarget(domain::contracts::IShardTransport& transport,
                                     domain::Endpoint endpoint,
                                     std::chrono::milliseconds timeout)
    : transport_(transport), endpoint_(std::move(endpoint)), timeout_(timeout) {}

void HttpReplicaTarget::apply(const std::vector<domain::UserRecord>& users,
                              const std::vector<domain::Message>& messages) {
    boost::json::object batch;
    batch["users"] = chs::http::to_json(users);
    batch["messages"] = chs::http::to_json(messages);
    const auto response = transport_.post(endpoint_, kReplicatePath, chs::http::serialize_json(batch), timeout_);
    requireOk(response, endpoint_, "batch of " + std::to_string(messages.size()) + " messages");
}

void HttpReplicaTarget::ping() {
    requireOk(transport_.get(endpoint_, "/health", timeout_), endpoint_, "health check");
}

}  // namespace infra::http
