#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace app {

// Copies users and recent messages from a shard's primary store to its
// standby on a fixed interval, in batches of at most batchSize messages.
// Runs on its own thread between start() and stop().
class ReplicationManager {
public:
    struct Options {
        domain::ShardId shardId{1};
        std::chrono::milliseconds interval{5000};
        std::chrono::milliseconds window{60000};
        std::chrono::milliseconds retryDelay{5000};
        std::size_t batchSize{500};
    };

    struct TickResult {
        std::size_t users{0};
        std::size_t messages{0};
        std::size_t batches{0};
    };

    using NowFn = std::function<domain::TimestampMs()>;

    ReplicationManager(domain::contracts::IMessageStore& primary,
                       domain::contracts::IReplicaTarget& backup,
                       Options options);

    ReplicationManager(domain::contracts::IMessageStore& primary,
                       domain::contracts::IReplicaTarget& backup,
                       Options options,
                       NowFn now);

    ~ReplicationManager();

    ReplicationManager(const ReplicationManager&) = delete;
    ReplicationManager& operator=(const ReplicationManager&) = delete;

    void start();

    // Interrupts the initialization back-off or the wait between ticks and
    // joins the worker.
    void stop();

    // One replication pass. Throws on store or transport failure; the
    // high-water mark only advances when every batch was applied.
    TickResult tick();

    std::optional<domain::TimestampMs> highWaterMark() const;

    std::uint64_t completedTicks() const noexcept { return completedTicks_.load(); }

private:
    void run();
    bool waitFor(std::chrono::milliseconds delay);
    bool initialize();

    domain::contracts::IMessageStore& primary_;
    domain::contracts::IReplicaTarget& backup_;
    Options options_;
    NowFn now_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopRequested_{false};

    mutable std::mutex markMutex_;
    std::optional<domain::TimestampMs> highWaterMark_;
    std::atomic<std::uint64_t> completedTicks_{0};
};

}  // namespace app
