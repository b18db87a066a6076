#include "app/ConnectionRegistry.hpp"

#include <utility>

namespace app {

void ConnectionRegistry::bind(const domain::UserId& userId, ChannelPtr channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[userId] = std::move(channel);
}

domain::UserId ConnectionRegistry::removeChannel(const domain::contracts::IPushChannel& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = channels_.begin(); it != channels_.end(); ++it) {
        if (it->second.get() == &channel) {
            auto userId = it->first;
            channels_.erase(it);
            return userId;
        }
    }
    return {};
}

ConnectionRegistry::ChannelPtr ConnectionRegistry::find(const domain::UserId& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = channels_.find(userId);
    return it == channels_.end() ? nullptr : it->second;
}

bool ConnectionRegistry::push(const domain::UserId& userId, const std::string& payload) const {
    const auto channel = find(userId);
    if (!channel) {
        return false;
    }
    return channel->send(payload);
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

}  // namespace app
