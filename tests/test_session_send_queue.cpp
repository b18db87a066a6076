#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "api/SessionSendQueue.hpp"
#include "api/WebSocketServer.hpp"
#include "app/ConnectionRegistry.hpp"
#include "app/MessageService.hpp"
#include "support/TestDoubles.hpp"

using chs::api::SessionSendQueue;

namespace {
using namespace std::chrono_literals;

bool waitForCondition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = SessionSendQueue::Clock::now() + timeout;
    while (SessionSendQueue::Clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

// Write callback that blocks until released, like a socket whose peer stopped reading.
struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open{false};
    std::atomic<int> entered{0};

    bool write(const std::string&) {
        entered.fetch_add(1);
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this]() { return open; });
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        cv.notify_all();
    }
};

}  // namespace

int main() {
    // Frames are written in order and close() drains them.
    {
        std::mutex mutex;
        std::vector<std::string> written;
        SessionSendQueue::Callbacks callbacks;
        callbacks.write = [&](const std::string& frame) {
            std::lock_guard<std::mutex> lock(mutex);
            written.push_back(frame);
            return true;
        };

        SessionSendQueue queue(SessionSendQueue::Config{}, callbacks);
        for (const char* frame : {"a", "b", "c"}) {
            if (!queue.enqueue(std::make_shared<const std::string>(frame))) {
                std::cerr << "Expected enqueue to accept frame " << frame << "\n";
                return 1;
            }
        }
        if (!queue.close(1000ms)) {
            std::cerr << "Expected close to drain the queue\n";
            return 1;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (written != std::vector<std::string>{"a", "b", "c"}) {
                std::cerr << "Expected frames written in order\n";
                return 1;
            }
        }
        if (queue.enqueue(std::make_shared<const std::string>("late"))) {
            std::cerr << "Expected closed queue to refuse frames\n";
            return 1;
        }
        queue.shutdown();
    }

    // A blocked writer never blocks enqueue; a full queue refuses and then stalls out.
    {
        Gate gate;
        std::atomic<int> stalls{0};
        SessionSendQueue::Config config;
        config.maxMessages = 2;
        config.maxBytes = 1024;
        config.stallTimeout = 80ms;
        SessionSendQueue::Callbacks callbacks;
        callbacks.write = [&gate](const std::string& frame) { return gate.write(frame); };
        callbacks.onStall = [&stalls]() { stalls.fetch_add(1); };

        SessionSendQueue queue(config, callbacks);
        queue.enqueue(std::make_shared<const std::string>("m1"));
        if (!waitForCondition([&]() { return gate.entered.load() == 1; }, 1000ms)) {
            std::cerr << "Expected the writer to pick up the first frame\n";
            return 1;
        }

        const auto started = SessionSendQueue::Clock::now();
        const bool second = queue.enqueue(std::make_shared<const std::string>("m2"));
        const bool third = queue.enqueue(std::make_shared<const std::string>("m3"));
        const bool fourth = queue.enqueue(std::make_shared<const std::string>("m4"));
        if (SessionSendQueue::Clock::now() - started > 50ms) {
            std::cerr << "Expected enqueue to return while the writer is blocked\n";
            return 1;
        }
        if (!second || !third || fourth || queue.queuedMessages() != 2) {
            std::cerr << "Expected two queued frames and the third refused\n";
            return 1;
        }

        if (!waitForCondition([&]() { return stalls.load() == 1; }, 1000ms)) {
            std::cerr << "Expected stall callback (stalls=" << stalls.load() << ")\n";
            return 1;
        }
        if (!queue.closed() || queue.queuedMessages() != 0) {
            std::cerr << "Expected stalled queue to be closed and emptied\n";
            return 1;
        }

        gate.release();
        queue.shutdown();
    }

    // A queue that drains below its limit disarms the stall timer.
    {
        std::atomic<int> stalls{0};
        SessionSendQueue::Config config;
        config.maxMessages = 1;
        config.stallTimeout = 50ms;
        SessionSendQueue::Callbacks callbacks;
        callbacks.write = [](const std::string&) {
            std::this_thread::sleep_for(5ms);
            return true;
        };
        callbacks.onStall = [&stalls]() { stalls.fetch_add(1); };

        SessionSendQueue queue(config, callbacks);
        for (int i = 0; i < 20; ++i) {
            queue.enqueue(std::make_shared<const std::string>("tick"));
            std::this_thread::sleep_for(10ms);
        }
        std::this_thread::sleep_for(100ms);
        if (stalls.load() != 0 || queue.closed()) {
            std::cerr << "Expected a draining queue to stay open\n";
            return 1;
        }
        queue.shutdown();
    }

    // Write path against a WebSocket session whose peer never reads.
    {
        int fds[2] = {-1, -1};
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
            std::cerr << "socketpair failed\n";
            return 1;
        }

        chs::api::WebSocketServer server("/ws");
        server.configureBackpressure(8, 1024 * 1024, 200ms);
        auto session = std::make_shared<chs::api::WebSocketServer::Session>(server, fds[0], 1);

        testing::InMemoryMessageStore store;
        testing::FlakyCache cache;
        app::ConnectionRegistry registry;
        registry.bind("2", session);
        app::MessageService service(store, cache, registry, app::MessageService::Options{1, 3, 300s});

        const std::string content(64 * 1024, 'x');
        auto writes = std::async(std::launch::async, [&]() {
            for (int i = 0; i < 64; ++i) {
                service.sendMessage("1", "2", content);
            }
        });
        if (writes.wait_for(3s) != std::future_status::ready) {
            std::cerr << "Expected writes to a non-reading recipient to complete\n";
            ::close(fds[1]);
            writes.wait();
            return 1;
        }
        writes.get();
        if (store.messageCount() != 64) {
            std::cerr << "Expected all 64 messages stored, got " << store.messageCount() << "\n";
            return 1;
        }

        if (!waitForCondition([&]() { return !session->active(); }, 2000ms)) {
            std::cerr << "Expected the stalled session to be disconnected\n";
            return 1;
        }
        if (registry.push("2", "after")) {
            std::cerr << "Expected push to a disconnected session to fail\n";
            return 1;
        }

        registry.removeChannel(*session);
        session.reset();
        ::close(fds[1]);
    }

    std::cout << "test_session_send_queue passed\n";
    return 0;
}
