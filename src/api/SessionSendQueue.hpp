#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chs::api {

// Outbound frames of one WebSocket session. enqueue() never touches the
// socket: a writer thread drains the queue through Callbacks::write, and a
// stall thread fires Callbacks::onStall when the queue stays at its limits
// for longer than stallTimeout.
class SessionSendQueue {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        std::size_t maxMessages = 500;
        std::size_t maxBytes = 15 * 1024 * 1024;  // 15 MB
        std::chrono::milliseconds stallTimeout{20000};
    };

    struct Callbacks {
        // Blocking write of one frame. Returns false on socket error.
        std::function<bool(const std::string&)> write;
        std::function<void()> onStall;
    };

    SessionSendQueue(const Config& config, Callbacks callbacks);
    ~SessionSendQueue();

    SessionSendQueue(const SessionSendQueue&) = delete;
    SessionSendQueue& operator=(const SessionSendQueue&) = delete;

    // False when the queue is closed or full; the frame is dropped.
    bool enqueue(std::shared_ptr<const std::string> frame);

    // Refuses further frames and waits up to drainTimeout for queued ones.
    // Returns true when everything queued was written.
    bool close(std::chrono::milliseconds drainTimeout);

    // Joins both threads. A write in progress must already be unblocked,
    // for example by shutting the socket down.
    void shutdown();

    std::size_t queuedMessages() const;
    std::size_t queuedBytes() const;
    bool closed() const;

private:
    void writerLoop();
    void stallLoop();
    bool atLimitLocked() const;
    void updateStallTimerLocked(Clock::time_point now);
    void clearQueueLocked();

    const Config config_;
    Callbacks callbacks_;

    mutable std::mutex mutex_;
    std::condition_variable writerCv_;
    std::condition_variable drainedCv_;
    std::condition_variable stallCv_;
    std::deque<std::shared_ptr<const std::string>> queue_;
    std::size_t queuedBytes_ = 0;
    bool writeInProgress_ = false;
    bool closed_ = false;
    bool stopThreads_ = false;

    bool stallArmed_ = false;
    Clock::time_point stallDeadline_{};

    std::thread writerThread_;
    std::thread stallThread_;
};

}  // namespace chs::api
