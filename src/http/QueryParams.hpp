#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "api/Controllers.hpp"

namespace chs::http {

// Percent-decodes a query or path component; '+' becomes a space.
std::string decode_component(std::string_view value);

std::optional<std::string> opt_string(const chs::api::Request& request, const char* key);

std::optional<int> opt_int(const chs::api::Request& request, const char* key);

std::optional<std::int64_t> opt_int64(const chs::api::Request& request, const char* key);

bool opt_flag(const chs::api::Request& request, const char* key);

// Reads ?limit=. Missing yields defaultLimit; values above maxLimit are
// clamped. Throws domain::ValidationError for non-numeric or non-positive values.
std::size_t parse_limit(const chs::api::Request& request, std::size_t defaultLimit, std::size_t maxLimit);

}  // namespace chs::http
