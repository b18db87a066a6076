#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "api/Controllers.hpp"

namespace chs::api {

// Method + path pattern table. Pattern segments starting with ':' bind the
// matching path segment into Request::params.
class Router {
public:
    using Handler = std::function<Response(const Request&)>;

    void add(std::string method, std::string pattern, Handler handler);

    // Dispatches to the first matching route. Domain exceptions thrown by a
    // handler are converted into JSON error responses.
    Response handle(Request request) const;

private:
    struct Route {
        std::string method;
        std::string pattern;
        std::vector<std::string> segments;
        Handler handler;
    };

    [[nodiscard]] static std::optional<std::map<std::string, std::string>> match(
        const Route& route, const std::vector<std::string>& pathSegments);

    std::vector<Route> routes_;
};

}  // namespace chs::api
