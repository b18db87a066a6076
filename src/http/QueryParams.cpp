#include "http/QueryParams.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>

#include "domain/Errors.hpp"

namespace {

std::optional<std::string> find_query_value(const std::string& query, std::string_view key) {
    std::size_t start = 0;
    while (start <= query.size()) {
        const auto end = query.find('&', start);
        const auto part = query.substr(start, end == std::string::npos ? std::string::npos : end - start);
        const auto eq = part.find('=');
        const std::string raw_key = eq == std::string::npos ? part : part.substr(0, eq);
        if (chs::http::decode_component(raw_key) == key) {
            return eq == std::string::npos ? std::string{} : chs::http::decode_component(part.substr(eq + 1));
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return std::nullopt;
}

template <typename T>
std::optional<T> parse_integral(const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return std::nullopt;
    }
    T result{};
    const auto* begin = value->data();
    const auto* end = begin + value->size();
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return result;
}

}  // namespace

namespace chs::http {

std::string decode_component(std::string_view value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            decoded.push_back(' ');
        }
        else if (ch == '%' && i + 2 < value.size()) {
            const char* begin = value.data() + i + 1;
            const char* end = begin + 2;
            unsigned int code{};
            auto [ptr, ec] = std::from_chars(begin, end, code, 16);
            if (ec == std::errc() && ptr == end) {
                decoded.push_back(static_cast<char>(code));
                i += 2;
            }
            else {
                decoded.push_back(ch);
            }
        }
        else {
            decoded.push_back(ch);
        }
    }
    return decoded;
}

std::optional<std::string> opt_string(const chs::api::Request& request, const char* key) {
    if (!key) {
        return std::nullopt;
    }
    return find_query_value(request.query, key);
}

std::optional<int> opt_int(const chs::api::Request& request, const char* key) {
    return parse_integral<int>(opt_string(request, key));
}

std::optional<std::int64_t> opt_int64(const chs::api::Request& request, const char* key) {
    return parse_integral<std::int64_t>(opt_string(request, key));
}

bool opt_flag(const chs::api::Request& request, const char* key) {
    auto value = opt_string(request, key);
    if (!value) {
        return false;
    }
    std::transform(value->begin(), value->end(), value->begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value->empty() || *value == "true" || *value == "1" || *value == "yes" || *value == "on";
}

std::size_t parse_limit(const chs::api::Request& request, std::size_t defaultLimit, std::size_t maxLimit) {
    const auto raw = opt_string(request, "limit");
    if (!raw || raw->empty()) {
        return std::min(defaultLimit, maxLimit);
    }
    const auto value = parse_integral<std::int64_t>(raw);
    if (!value || *value <= 0) {
        throw domain::ValidationError("limit must be a positive integer");
    }
    return std::min(static_cast<std::size_t>(*value), maxLimit);
}

}  // namespace chs::http
