#include "domain/ShardMap.hpp"

#include <charconv>
#include <string>
#include <system_error>

#include "domain/Errors.hpp"

namespace domain {

std::int64_t parseUserId(std::string_view userId) {
    if (userId.empty()) {
        throw ValidationError("user id is required");
    }

    const char* begin = userId.data();
    const char* end = begin + userId.size();
    if (*begin == '+') {
        ++begin;
        if (begin != end && *begin == '-') {
            throw ValidationError("user id must be an integer: " + std::string{userId});
        }
    }

    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc::result_out_of_range) {
        throw ValidationError("user id out of range: " + std::string{userId});
    }
    if (ec != std::errc() || ptr != end || begin == end) {
        throw ValidationError("user id must be an integer: " + std::string{userId});
    }
    return value;
}

UserId normalizeUserId(std::string_view userId) {
    return std::to_string(parseUserId(userId));
}

ShardId shardOf(std::int64_t userId, std::uint32_t shardCount) {
    if (shardCount == 0U) {
        throw ValidationError("shard count must be positive");
    }
    if (shardCount > kMaxShardCount) {
        throw ValidationError("shard count " + std::to_string(shardCount) + " exceeds "
                              + std::to_string(kMaxShardCount));
    }

    // Negating in unsigned space keeps INT64_MIN well defined.
    const auto magnitude = userId < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(userId)
                                      : static_cast<std::uint64_t>(userId);
    const auto index = magnitude % shardCount;
    return static_cast<ShardId>(index == 0U ? shardCount : index);
}

ShardId shardOf(std::string_view userId, std::uint32_t shardCount) {
    return shardOf(parseUserId(userId), shardCount);
}

}  // namespace domain
