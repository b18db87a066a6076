#pragma once

#include <string>

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace chs::http {

std::string serialize_json(const boost::json::value& value);

// Parses a request or upstream body. Throws domain::ValidationError when the
// text is not valid JSON.
boost::json::value parse_json(const std::string& text);

const char* status_reason(int statusCode);

// Serializes value into the response body and sets the basic metadata.
void write_json(chs::api::Response& response, const boost::json::value& value, int statusCode = 200);

}  // namespace chs::http
