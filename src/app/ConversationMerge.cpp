#include "app/ConversationMerge.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <tuple>
#include <utility>

namespace app {

std::vector<domain::Message> mergeConversation(std::vector<domain::Message> senderShard,
                                               std::vector<domain::Message> recipientShard) {
    std::vector<domain::Message> merged = std::move(senderShard);
    merged.insert(merged.end(),
                  std::make_move_iterator(recipientShard.begin()),
                  std::make_move_iterator(recipientShard.end()));

    std::stable_sort(merged.begin(), merged.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.createdAtMs < rhs.createdAtMs;
    });

    std::set<std::tuple<std::string, std::string, domain::TimestampMs>> seen;
    std::vector<domain::Message> unique;
    unique.reserve(merged.size());
    for (auto& message : merged) {
        if (seen.emplace(message.fromUserId, message.toUserId, message.createdAtMs).second) {
            unique.push_back(std::move(message));
        }
    }
    return unique;
}

}  // namespace app
