#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

// Connected users of one shard node. At most one channel per user id; a new
// registration replaces the previous one without closing it.
class ConnectionRegistry {
public:
    using ChannelPtr = std::shared_ptr<domain::contracts::IPushChannel>;

    void bind(const domain::UserId& userId, ChannelPtr channel);

    // Drops whichever entry points at this channel. Returns the user id that
    // was bound to it, or an empty string.
    domain::UserId removeChannel(const domain::contracts::IPushChannel& channel);

    ChannelPtr find(const domain::UserId& userId) const;

    // Sends payload to userId when connected. False when the user is absent
    // or the channel refused the frame.
    bool push(const domain::UserId& userId, const std::string& payload) const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<domain::UserId, ChannelPtr> channels_;
};

}  // namespace app
