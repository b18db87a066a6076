#include "api/SessionSendQueue.hpp"

#include <utility>

#include "common/Log.hpp"

namespace chs::api {

SessionSendQueue::SessionSendQueue(const Config& config, Callbacks callbacks)
    : config_(config), callbacks_(std::move(callbacks)) {
    writerThread_ = std::thread([this]() { writerLoop(); });
    stallThread_ = std::thread([this]() { stallLoop(); });
}

SessionSendQueue::~SessionSendQueue() { shutdown(); }

bool SessionSendQueue::enqueue(std::shared_ptr<const std::string> frame) {
    if (!frame) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || stopThreads_ || atLimitLocked()) {
        return false;
    }
    queuedBytes_ += frame->size();
    queue_.push_back(std::move(frame));
    updateStallTimerLocked(Clock::now());
    writerCv_.notify_one();
    return true;
}

bool SessionSendQueue::close(std::chrono::milliseconds drainTimeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    return drainedCv_.wait_for(lock, drainTimeout, [this]() {
        return stopThreads_ || (queue_.empty() && !writeInProgress_);
    }) && queue_.empty();
}

void SessionSendQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        stopThreads_ = true;
        clearQueueLocked();
    }
    writerCv_.notify_all();
    stallCv_.notify_all();
    drainedCv_.notify_all();

    for (auto* thread : {&writerThread_, &stallThread_}) {
        if (thread->joinable() && thread->get_id() != std::this_thread::get_id()) {
            thread->join();
        }
    }
}

std::size_t SessionSendQueue::queuedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t SessionSendQueue::queuedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queuedBytes_;
}

bool SessionSendQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void SessionSendQueue::writerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        writerCv_.wait(lock, [this]() { return stopThreads_ || !queue_.empty(); });
        if (stopThreads_) {
            break;
        }

        auto frame = std::move(queue_.front());
        queue_.pop_front();
        queuedBytes_ = queuedBytes_ >= frame->size() ? queuedBytes_ - frame->size() : 0;
        writeInProgress_ = true;
        updateStallTimerLocked(Clock::now());

        lock.unlock();
        const bool written = callbacks_.write && callbacks_.write(*frame);
        lock.lock();

        writeInProgress_ = false;
        if (!written && !closed_) {
            LOG_DEBUG("ws_send_queue write failed, dropping " << queue_.size() << " queued frames");
            closed_ = true;
            clearQueueLocked();
        }
        if (queue_.empty()) {
            drainedCv_.notify_all();
        }
    }
    writeInProgress_ = false;
    drainedCv_.notify_all();
}

void SessionSendQueue::stallLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopThreads_) {
        if (!stallArmed_) {
            stallCv_.wait(lock, [this]() { return stopThreads_ || stallArmed_; });
            continue;
        }

        const auto deadline = stallDeadline_;
        const bool woke = stallCv_.wait_until(lock, deadline, [this]() { return stopThreads_ || !stallArmed_; });
        if (stopThreads_ || woke) {
            continue;
        }
        stallArmed_ = false;
        if (!atLimitLocked()) {
            continue;
        }

        LOG_WARN("ws_send_queue stalled for " << config_.stallTimeout.count() << "ms with " << queue_.size()
                                              << " frames / " << queuedBytes_ << " bytes queued");
        closed_ = true;
        clearQueueLocked();
        drainedCv_.notify_all();
        auto onStall = callbacks_.onStall;
        lock.unlock();
        if (onStall) {
            onStall();
        }
        lock.lock();
    }
}

bool SessionSendQueue::atLimitLocked() const {
    if (config_.maxMessages > 0 && queue_.size() >= config_.maxMessages) {
        return true;
    }
    if (config_.maxBytes > 0 && queuedBytes_ >= config_.maxBytes) {
        return true;
    }
    return false;
}

void SessionSendQueue::updateStallTimerLocked(Clock::time_point now) {
    if (atLimitLocked()) {
        if (!stallArmed_) {
            stallArmed_ = true;
            stallDeadline_ = now + config_.stallTimeout;
            stallCv_.notify_all();
        }
    }
    else if (stallArmed_) {
        stallArmed_ = false;
        stallCv_.notify_all();
    }
}

void SessionSendQueue::clearQueueLocked() {
    queue_.clear();
    queuedBytes_ = 0;
}

}  // namespace chs::api
