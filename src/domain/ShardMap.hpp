#pragma once

#include <climits>
#include <cstdint>
#include <string_view>

#include "domain/Models.hpp"

namespace domain {

// Parses a decimal user id. Throws ValidationError for empty input,
// non-digit characters or values outside int64.
std::int64_t parseUserId(std::string_view userId);

// Canonical decimal spelling ("07" and "+7" become "7"). Every store key,
// cache key and registry key uses this form.
UserId normalizeUserId(std::string_view userId);

// Largest shard count whose ids still fit ShardId.
constexpr std::uint32_t kMaxShardCount = static_cast<std::uint32_t>(INT32_MAX);

// 1-based shard assignment: abs(userId) mod shardCount, with 0 mapped to
// shardCount. Gateway and shard nodes must agree on this function. Throws
// ValidationError when shardCount is 0 or above kMaxShardCount.
ShardId shardOf(std::int64_t userId, std::uint32_t shardCount);

ShardId shardOf(std::string_view userId, std::uint32_t shardCount);

}  // namespace domain
