#include "api/Controllers.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include <boost/json/object.hpp>

#include "common/Metrics.hpp"
#include "http/HttpJson.hpp"

namespace chs::api {

const std::string& Request::param(const std::string& name) const {
    const auto it = params.find(name);
    if (it == params.end()) {
        throw std::out_of_range("route parameter not bound: " + name);
    }
    return it->second;
}

Response health(std::string_view service) {
    boost::json::object payload;
    payload["status"] = "ok";
    payload["service"] = service;

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

Response stats(const Request&) {
    const auto snapshot = common::metrics::Registry::instance().snapshot();
    const auto uptimeSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.capturedAt - snapshot.startTime).count();

    auto threadCount = std::thread::hardware_concurrency();
    if (threadCount == 0U) {
        threadCount = 1U;
    }

    boost::json::object counters;
    for (const auto& [name, value] : snapshot.counters) {
        counters[name] = value;
    }

    boost::json::object routes;
    for (const auto& [route, metrics] : snapshot.routes) {
        boost::json::object entry;
        entry["requests"] = metrics.totalRequests;
        if (metrics.p95Ms.has_value()) {
            entry["p95_ms"] = *metrics.p95Ms;
        }
        if (metrics.maxMs.has_value()) {
            entry["max_ms"] = *metrics.maxMs;
        }
        routes[route] = std::move(entry);
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["threads"] = threadCount;
    payload["counters"] = std::move(counters);
    payload["routes"] = std::move(routes);

    Response response;
    chs::http::write_json(response, payload);
    return response;
}

}  // namespace chs::api
