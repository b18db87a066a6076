#include "api/Router.hpp"

#include <exception>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "http/ErrorCodes.hpp"
#include "http/QueryParams.hpp"
#include "http/json_error.hpp"

namespace chs::api {

namespace {

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start < path.size()) {
        if (path[start] == '/') {
            ++start;
            continue;
        }
        const auto end = path.find('/', start);
        segments.push_back(path.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return segments;
}

}  // namespace

void Router::add(std::string method, std::string pattern, Handler handler) {
    auto segments = splitPath(pattern);
    routes_.push_back(Route{std::move(method), std::move(pattern), std::move(segments), std::move(handler)});
}

std::optional<std::map<std::string, std::string>> Router::match(const Route& route,
                                                                const std::vector<std::string>& pathSegments) {
    if (route.segments.size() != pathSegments.size()) {
        return std::nullopt;
    }
    std::map<std::string, std::string> params;
    for (std::size_t i = 0; i < pathSegments.size(); ++i) {
        const auto& expected = route.segments[i];
        if (!expected.empty() && expected.front() == ':') {
            if (pathSegments[i].empty()) {
                return std::nullopt;
            }
            params.emplace(expected.substr(1), chs::http::decode_component(pathSegments[i]));
        }
        else if (expected != pathSegments[i]) {
            return std::nullopt;
        }
    }
    return params;
}

Response Router::handle(Request request) const {
    const auto pathSegments = splitPath(request.path);

    for (const auto& route : routes_) {
        if (route.method != request.method) {
            continue;
        }
        auto params = match(route, pathSegments);
        if (!params) {
            continue;
        }

        const auto key = makeKey(route.method, route.pattern);
        common::metrics::Registry::ScopedTimer timer(key);
        request.params = std::move(*params);

        Response response;
        try {
            return route.handler(request);
        }
        catch (const domain::ValidationError& ex) {
            LOG_DEBUG(key << " rejected: " << ex.what());
            chs::http::json_error(response, 400, chs::http::errors::validation_failed, ex.what());
        }
        catch (const domain::ServiceUnavailableError& ex) {
            LOG_WARN(key << " unavailable: " << ex.what());
            chs::http::json_error(response, 503, chs::http::errors::service_unavailable, ex.what());
        }
        catch (const domain::StoreError& ex) {
            LOG_ERR(key << " store failure: " << ex.what());
            chs::http::json_error(response, 500, chs::http::errors::store_failed, ex.what());
        }
        catch (const std::exception& ex) {
            LOG_ERR(key << " failed: " << ex.what());
            chs::http::json_error(response, 500, chs::http::errors::internal_error);
        }
        return response;
    }

    common::metrics::Registry::instance().incrementCounter("http.not_found");
    Response response;
    chs::http::json_error(response, 404, chs::http::errors::not_found);
    return response;
}

}  // namespace chs::api
