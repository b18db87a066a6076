#pragma once

#include <string_view>

#include "api/Controllers.hpp"

namespace chs::http {

// Writes {"error":"..."} (plus "details" when given) and sets the HTTP status.
void json_error(chs::api::Response& response,
                int statusCode,
                std::string_view errorCode,
                std::string_view details = {});

}  // namespace chs::http
