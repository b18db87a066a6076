#pragma once

#include <vector>

#include "domain/Models.hpp"

namespace app {

// Concatenates per-shard results (sender shard first), stable-sorts them by
// createdAtMs ascending and keeps the first message of each
// (from, to, createdAtMs) triple.
std::vector<domain::Message> mergeConversation(std::vector<domain::Message> senderShard,
                                               std::vector<domain::Message> recipientShard);

}  // namespace app
