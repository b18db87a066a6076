#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "api/Controllers.hpp"
#include "api/SessionSendQueue.hpp"
#include "domain/Ports.hpp"

namespace chs::api {

// RFC 6455 server-side sessions on top of sockets accepted by HttpServer.
// Each session runs a blocking reader thread and writes through its own
// SessionSendQueue, so send() never blocks the caller. One shared thread
// sends pings and drops peers that stop answering.
class WebSocketServer {
public:
    class Session;
    using SessionPtr = std::shared_ptr<Session>;
    using MessageHandler = std::function<void(const SessionPtr& session, const std::string& text)>;
    using CloseHandler = std::function<void(const SessionPtr& session)>;

    class Session : public domain::contracts::IPushChannel {
    public:
        Session(WebSocketServer& server, int fd, std::uint64_t id);
        ~Session() override;

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        // Queues a text frame. False when the session is closed or its send
        // queue is full.
        bool send(const std::string& payload) override;
        std::uint64_t channelId() const override { return id_; }

        bool active() const noexcept { return active_.load(); }
        std::size_t queuedFrames() const { return sendQueue_->queuedMessages(); }

    private:
        friend class WebSocketServer;

        bool writeFrame(const std::string& frame);
        void onSendStall();

        WebSocketServer& server_;
        const std::uint64_t id_;
        std::atomic<int> fd_;
        std::unique_ptr<SessionSendQueue> sendQueue_;
        std::atomic<bool> active_{true};
        std::atomic<bool> closing_{false};
        std::atomic<std::int64_t> lastActivityMs_{0};
        std::atomic<std::int64_t> lastPingMs_{0};
        std::atomic<std::int64_t> lastPongMs_{0};
        int consecutivePongMisses_{0};
    };

    explicit WebSocketServer(std::string path = "/ws");
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Takes over clientFd when request is an upgrade to our path. Returns
    // false for any other request.
    bool handleClient(int clientFd, const Request& request);

    void setMessageHandler(MessageHandler handler);
    void setCloseHandler(CloseHandler handler);

    void configureKeepAlive(std::chrono::milliseconds pingPeriod, std::chrono::milliseconds pongTimeout);

    // Limits for sessions opened afterwards. A session whose queue stays full
    // for stallTimeout is disconnected.
    void configureBackpressure(std::size_t maxMessages, std::size_t maxBytes, std::chrono::milliseconds stallTimeout);

    // Closes every session and waits for reader threads to exit.
    void stop();

    std::size_t sessionCount() const;

private:
    bool performHandshake(int clientFd, const Request& request);
    bool sendFrame(Session& session, std::uint8_t opcode, const std::string& payload);
    SessionSendQueue::Config sendQueueConfig() const;
    void sessionLoop(const SessionPtr& session);
    void removeSession(const SessionPtr& session);
    bool closeWithReason(const SessionPtr& session, std::uint16_t closeCode, const std::string& reason);
    static void closeSessionSocket(Session& session);
    static bool recvAll(int fd, void* buffer, std::size_t length);
    void keepAliveLoop();

    const std::string path_;
    MessageHandler messageHandler_;
    CloseHandler closeHandler_;

    mutable std::mutex sessionsMutex_;
    std::vector<SessionPtr> sessions_;
    std::atomic<std::uint64_t> nextSessionId_{1};

    std::atomic<bool> running_{true};
    std::thread keepAliveThread_;
    std::mutex keepAliveMutex_;
    std::condition_variable keepAliveCv_;
    std::atomic<std::int64_t> pingPeriodMs_{30000};
    std::atomic<std::int64_t> pongTimeoutMs_{75000};
    std::atomic<std::size_t> sendQueueMaxMessages_{500};
    std::atomic<std::size_t> sendQueueMaxBytes_{15728640};
    std::atomic<std::int64_t> sendQueueStallMs_{20000};

    std::mutex readersMutex_;
    std::condition_variable readersCv_;
    std::size_t activeReaders_{0};
};

}  // namespace chs::api
