#include "http/HttpJson.hpp"

#include <array>
#include <string>

#include <boost/json/parse.hpp>
#include <boost/json/serializer.hpp>

#include "domain/Errors.hpp"

namespace chs::http {

const char* status_reason(int statusCode) {
    switch (statusCode) {
    case 200:
        return "OK";
    case 201:
        return "Created";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        break;
    }
    return "Unknown";
}

std::string serialize_json(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};

    while (!sr.done()) {
        boost::json::string_view chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }

    return result;
}

boost::json::value parse_json(const std::string& text) {
    boost::json::error_code ec;
    auto value = boost::json::parse(text, ec);
    if (ec) {
        throw domain::ValidationError("invalid JSON: " + ec.message());
    }
    return value;
}

void write_json(chs::api::Response& response, const boost::json::value& value, int statusCode) {
    response.body = serialize_json(value);
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace chs::http
