#include "infra/http/BeastShardTransport.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "domain/Errors.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;

domain::TransportError makeError(bhttp::verb method,
                                 const domain::Endpoint& endpoint,
                                 const std::string& target,
                                 const std::string& message) {
    std::ostringstream oss;
    oss << bhttp::to_string(method) << " http://" << endpoint.toString() << target << " failed: " << message;
    return domain::TransportError(oss.str());
}

domain::contracts::TransportResponse performRequest(bhttp::verb method,
                                                    const domain::Endpoint& endpoint,
                                                    const std::string& target,
                                                    const std::optional<std::string>& jsonBody,
                                                    std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        throw makeError(method, endpoint, target, "timeout must be positive");
    }

    net::io_context ioc;
    net::ip::tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    beast::error_code ec;
    const auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
    if (ec) {
        throw makeError(method, endpoint, target, "DNS resolution error: " + ec.message());
    }

    stream.expires_after(timeout);
    stream.connect(results, ec);
    if (ec) {
        throw makeError(method, endpoint, target, "Connection error: " + ec.message());
    }

    bhttp::request<bhttp::string_body> req{method, target, 11};
    req.set(bhttp::field::host, endpoint.host);
    req.set(bhttp::field::user_agent, "chatshard-gateway/0.1");
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");
    if (jsonBody) {
        req.set(bhttp::field::content_type, "application/json");
        req.body() = *jsonBody;
    }
    req.prepare_payload();

    bhttp::write(stream, req, ec);
    if (ec) {
        throw makeError(method, endpoint, target, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> response;
    bhttp::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(method, endpoint, target, "Read error: " + ec.message());
    }

    stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);

    domain::contracts::TransportResponse result;
    result.status = static_cast<unsigned>(response.result_int());
    result.body = std::move(response.body());
    return result;
}

}  // namespace

domain::contracts::TransportResponse BeastShardTransport::get(const domain::Endpoint& endpoint,
                                                              const std::string& target,
                                                              std::chrono::milliseconds timeout) {
    return performRequest(bhttp::verb::get, endpoint, target, std::nullopt, timeout);
}

domain::contracts::TransportResponse BeastShardTransport::post(const domain::Endpoint& endpoint,
                                                               const std::string& target,
                                                               const std::string& jsonBody,
                                                               std::chrono::milliseconds timeout) {
    return performRequest(bhttp::verb::post, endpoint, target, jsonBody, timeout);
}

}  // namespace infra::http
