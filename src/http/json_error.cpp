#include "http/json_error.hpp"

#include <boost/json/object.hpp>

#include "http/HttpJson.hpp"

namespace chs::http {

void json_error(chs::api::Response& response, int statusCode, std::string_view errorCode, std::string_view details) {
    boost::json::object payload;
    payload["error"] = errorCode;
    if (!details.empty()) {
        payload["details"] = details;
    }
    write_json(response, payload, statusCode);
}

}  // namespace chs::http
