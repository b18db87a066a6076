#pragma once

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chs::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
    std::string body;
    // Header names lower-cased.
    std::unordered_map<std::string, std::string> headers;
    // Filled by the router from ":name" segments of the matched pattern.
    std::map<std::string, std::string> params;

    const std::string& param(const std::string& name) const;
};

struct Response {
    int statusCode{200};
    std::string statusText{"OK"};
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

// GET /health: {"status":"ok","service":...}.
Response health(std::string_view service);

// GET /stats: uptime, counters and per-route request totals.
Response stats(const Request& request);

}  // namespace chs::api
