#pragma once

#include <string_view>

namespace chs::http::errors {

inline constexpr std::string_view validation_failed = "validation_failed";
inline constexpr std::string_view service_unavailable = "service_unavailable";
inline constexpr std::string_view store_failed = "store_failed";
inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view internal_error = "internal_error";

}  // namespace chs::http::errors
