#include "api/WebSocketServer.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace chs::api {

namespace {

constexpr const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr std::size_t kMaxFrameSize = 1 * 1024 * 1024;
constexpr std::uint16_t kCloseCodeNormal = 1000;
constexpr std::uint16_t kCloseCodeGoingAway = 1001;
constexpr std::uint16_t kCloseCodeAbnormal = 1006;
constexpr std::chrono::milliseconds kCloseDrainTimeout{500};

constexpr std::uint8_t kOpContinuation = 0x0;
constexpr std::uint8_t kOpText = 0x1;
constexpr std::uint8_t kOpClose = 0x8;
constexpr std::uint8_t kOpPing = 0x9;
constexpr std::uint8_t kOpPong = 0xA;

std::int64_t steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

std::string toLower(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

std::string headerValue(const Request& request, const char* name) {
    const auto it = request.headers.find(name);
    return it == request.headers.end() ? std::string{} : it->second;
}

std::string base64Encode(const std::uint8_t* data, std::size_t len) {
    static constexpr char chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string output;
    output.reserve(((len + 2) / 3) * 4);

    for (std::size_t i = 0; i < len; i += 3) {
        const std::uint32_t octetA = data[i];
        const std::uint32_t octetB = (i + 1 < len) ? data[i + 1] : 0U;
        const std::uint32_t octetC = (i + 2 < len) ? data[i + 2] : 0U;
        const std::uint32_t triple = (octetA << 16) | (octetB << 8) | octetC;

        output.push_back(chars[(triple >> 18) & 0x3FU]);
        output.push_back(chars[(triple >> 12) & 0x3FU]);
        output.push_back(i + 1 < len ? chars[(triple >> 6) & 0x3FU] : '=');
        output.push_back(i + 2 < len ? chars[triple & 0x3FU] : '=');
    }

    return output;
}

std::string computeAcceptKey(const std::string& clientKey) {
    const std::string input = clientKey + kWebSocketGuid;
    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    ::SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest.data());
    return base64Encode(digest.data(), digest.size());
}

bool sendAll(int fd, const char* data, std::size_t length) {
    while (length > 0) {
        const auto written = ::send(fd, data, length, MSG_NOSIGNAL);
        if (written <= 0) {
            return false;
        }
        length -= static_cast<std::size_t>(written);
        data += written;
    }
    return true;
}

std::string encodeFrame(std::uint8_t opcode, const std::string& payload) {
    std::string frame;
    frame.reserve(10 + payload.size());
    frame.push_back(static_cast<char>(0x80U | (opcode & 0x0FU)));

    const std::uint64_t payloadSize = payload.size();
    if (payloadSize <= 125U) {
        frame.push_back(static_cast<char>(payloadSize & 0x7FU));
    } else if (payloadSize <= 0xFFFFU) {
        frame.push_back(static_cast<char>(126U));
        frame.push_back(static_cast<char>((payloadSize >> 8) & 0xFFU));
        frame.push_back(static_cast<char>(payloadSize & 0xFFU));
    } else {
        frame.push_back(static_cast<char>(127U));
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame.push_back(static_cast<char>((payloadSize >> shift) & 0xFFU));
        }
    }
    frame.append(payload);
    return frame;
}

void sendHttpError(int fd, int statusCode, const std::string& statusText, const std::string& body) {
    std::ostringstream response;
    response << "HTTP/1.1 " << statusCode << ' ' << statusText << "\r\n";
    response << "Content-Type: text/plain\r\n";
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << body;

    const auto responseStr = response.str();
    sendAll(fd, responseStr.data(), responseStr.size());
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
}

}  // namespace

WebSocketServer::Session::Session(WebSocketServer& server, int fd, std::uint64_t id)
    : server_(server), id_(id), fd_(fd) {
    const auto nowMs = steadyNowMs();
    lastActivityMs_.store(nowMs);
    lastPingMs_.store(nowMs);
    lastPongMs_.store(nowMs);

    SessionSendQueue::Callbacks callbacks;
    callbacks.write = [this](const std::string& frame) { return writeFrame(frame); };
    callbacks.onStall = [this]() { onSendStall(); };
    sendQueue_ = std::make_unique<SessionSendQueue>(server.sendQueueConfig(), std::move(callbacks));
}

WebSocketServer::Session::~Session() {
    const int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
    sendQueue_->shutdown();
    if (fd >= 0) {
        ::close(fd);
    }
}

bool WebSocketServer::Session::send(const std::string& payload) {
    return server_.sendFrame(*this, kOpText, payload);
}

bool WebSocketServer::Session::writeFrame(const std::string& frame) {
    const int fd = fd_.load();
    return fd >= 0 && sendAll(fd, frame.data(), frame.size());
}

// Runs on the send queue's stall thread. Shutting the socket down unblocks
// the writer and makes the reader thread finish the close.
void WebSocketServer::Session::onSendStall() {
    active_.store(false);
    const int fd = fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
    common::metrics::Registry::instance().incrementCounter("ws.close.backpressure");
    LOG_WARN("WebSocket session " << id_ << " disconnected: client is not reading");
}

WebSocketServer::WebSocketServer(std::string path) : path_(std::move(path)) {
    keepAliveThread_ = std::thread([this]() { keepAliveLoop(); });
}

WebSocketServer::~WebSocketServer() { stop(); }

void WebSocketServer::setMessageHandler(MessageHandler handler) { messageHandler_ = std::move(handler); }

void WebSocketServer::setCloseHandler(CloseHandler handler) { closeHandler_ = std::move(handler); }

void WebSocketServer::configureKeepAlive(std::chrono::milliseconds pingPeriod,
                                         std::chrono::milliseconds pongTimeout) {
    const auto safePing = std::max<std::int64_t>(1, pingPeriod.count());
    const auto safePong = std::max<std::int64_t>(1, pongTimeout.count());
    pingPeriodMs_.store(safePing);
    pongTimeoutMs_.store(safePong);
    keepAliveCv_.notify_all();
    LOG_INFO("WebSocket keep-alive: ping_period=" << safePing << "ms pong_timeout=" << safePong << "ms");
}

void WebSocketServer::configureBackpressure(std::size_t maxMessages,
                                            std::size_t maxBytes,
                                            std::chrono::milliseconds stallTimeout) {
    const auto safeStall = std::max<std::int64_t>(1, stallTimeout.count());
    sendQueueMaxMessages_.store(maxMessages);
    sendQueueMaxBytes_.store(maxBytes);
    sendQueueStallMs_.store(safeStall);
    LOG_INFO("WebSocket backpressure: max_msgs=" << maxMessages << " max_bytes=" << maxBytes
                                                 << " stall_timeout=" << safeStall << "ms");
}

SessionSendQueue::Config WebSocketServer::sendQueueConfig() const {
    SessionSendQueue::Config config;
    config.maxMessages = sendQueueMaxMessages_.load();
    config.maxBytes = sendQueueMaxBytes_.load();
    config.stallTimeout = std::chrono::milliseconds(sendQueueStallMs_.load());
    return config;
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    keepAliveCv_.notify_all();
    if (keepAliveThread_.joinable()) {
        keepAliveThread_.join();
    }

    std::vector<SessionPtr> sessionsCopy;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessionsCopy = sessions_;
    }
    for (const auto& session : sessionsCopy) {
        closeWithReason(session, kCloseCodeGoingAway, "server_shutdown");
    }

    std::unique_lock<std::mutex> lock(readersMutex_);
    readersCv_.wait(lock, [this]() { return activeReaders_ == 0; });
}

std::size_t WebSocketServer::sessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

bool WebSocketServer::handleClient(int clientFd, const Request& request) {
    if (request.method != "GET" || request.path != path_) {
        return false;
    }
    if (!running_.load()) {
        ::shutdown(clientFd, SHUT_RDWR);
        ::close(clientFd);
        return true;
    }
    if (!performHandshake(clientFd, request)) {
        return true;
    }

    auto session = std::make_shared<Session>(*this, clientFd, nextSessionId_.fetch_add(1));

    std::size_t activeSessions = 0;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions_.push_back(session);
        activeSessions = sessions_.size();
    }
    {
        std::lock_guard<std::mutex> lock(readersMutex_);
        ++activeReaders_;
    }

    std::thread([this, session]() {
        sessionLoop(session);
        std::lock_guard<std::mutex> lock(readersMutex_);
        --activeReaders_;
        readersCv_.notify_all();
    }).detach();

    common::metrics::Registry::instance().incrementCounter("ws.sessions_opened");
    LOG_INFO("WebSocket session " << session->channelId() << " connected (" << activeSessions << " active)");
    return true;
}

bool WebSocketServer::performHandshake(int clientFd, const Request& request) {
    if (toLower(headerValue(request, "upgrade")) != "websocket") {
        sendHttpError(clientFd, 400, "Bad Request", "Missing or invalid Upgrade header\n");
        return false;
    }
    if (toLower(headerValue(request, "connection")).find("upgrade") == std::string::npos) {
        sendHttpError(clientFd, 400, "Bad Request", "Connection header must include 'Upgrade'\n");
        return false;
    }
    const auto clientKey = headerValue(request, "sec-websocket-key");
    if (clientKey.empty()) {
        sendHttpError(clientFd, 400, "Bad Request", "Missing Sec-WebSocket-Key header\n");
        return false;
    }

    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n";
    response << "Upgrade: websocket\r\n";
    response << "Connection: Upgrade\r\n";
    response << "Sec-WebSocket-Accept: " << computeAcceptKey(clientKey) << "\r\n\r\n";

    const auto responseStr = response.str();
    if (!sendAll(clientFd, responseStr.data(), responseStr.size())) {
        ::shutdown(clientFd, SHUT_RDWR);
        ::close(clientFd);
        return false;
    }
    return true;
}

bool WebSocketServer::sendFrame(Session& session, std::uint8_t opcode, const std::string& payload) {
    if (!session.active_.load()) {
        return false;
    }
    return session.sendQueue_->enqueue(std::make_shared<const std::string>(encodeFrame(opcode, payload)));
}

void WebSocketServer::sessionLoop(const SessionPtr& session) {
    std::uint16_t closeCode = kCloseCodeGoingAway;
    std::string reason = "server_shutdown";
    std::string pendingText;
    std::array<std::uint8_t, 2> header{};

    while (running_.load() && session->active()) {
        const int fd = session->fd_.load();
        if (fd < 0 || !recvAll(fd, header.data(), header.size())) {
            closeCode = kCloseCodeAbnormal;
            reason = "read_error";
            break;
        }

        const bool fin = (header[0] & 0x80U) != 0;
        const auto opcode = static_cast<std::uint8_t>(header[0] & 0x0FU);
        const bool masked = (header[1] & 0x80U) != 0;
        std::uint64_t payloadLen = static_cast<std::uint64_t>(header[1] & 0x7FU);

        if (!masked) {
            LOG_WARN("WebSocket session " << session->channelId() << " sent an unmasked frame");
            closeCode = kCloseCodeAbnormal;
            reason = "protocol_error";
            break;
        }

        bool lengthOk = true;
        if (payloadLen == 126U) {
            std::array<std::uint8_t, 2> extended{};
            lengthOk = recvAll(fd, extended.data(), extended.size());
            payloadLen = (static_cast<std::uint64_t>(extended[0]) << 8U) | static_cast<std::uint64_t>(extended[1]);
        } else if (payloadLen == 127U) {
            std::array<std::uint8_t, 8> extended{};
            lengthOk = recvAll(fd, extended.data(), extended.size());
            payloadLen = 0;
            for (std::uint8_t byte : extended) {
                payloadLen = (payloadLen << 8U) | static_cast<std::uint64_t>(byte);
            }
        }
        if (!lengthOk || payloadLen > kMaxFrameSize || pendingText.size() + payloadLen > kMaxFrameSize) {
            closeCode = kCloseCodeAbnormal;
            reason = lengthOk ? "frame_too_large" : "read_error";
            break;
        }

        std::array<std::uint8_t, 4> mask{};
        std::vector<std::uint8_t> payload(static_cast<std::size_t>(payloadLen));
        if (!recvAll(fd, mask.data(), mask.size())
            || (payloadLen > 0 && !recvAll(fd, payload.data(), payload.size()))) {
            closeCode = kCloseCodeAbnormal;
            reason = "read_error";
            break;
        }
        for (std::size_t i = 0; i < payload.size(); ++i) {
            payload[i] ^= mask[i % 4U];
        }

        session->lastActivityMs_.store(steadyNowMs());

        if (opcode == kOpClose) {
            closeCode = kCloseCodeNormal;
            reason = "client_close";
            break;
        }
        if (opcode == kOpPing) {
            if (!sendFrame(*session, kOpPong, std::string(payload.begin(), payload.end()))) {
                LOG_DEBUG("WebSocket session " << session->channelId() << " pong not queued");
            }
            continue;
        }
        if (opcode == kOpPong) {
            session->lastPongMs_.store(steadyNowMs());
            continue;
        }
        if (opcode != kOpText && opcode != kOpContinuation) {
            continue;
        }

        pendingText.append(payload.begin(), payload.end());
        if (!fin) {
            continue;
        }

        common::metrics::Registry::instance().incrementCounter("ws.messages_received");
        if (messageHandler_) {
            try {
                messageHandler_(session, pendingText);
            }
            catch (const std::exception& ex) {
                LOG_ERR("WebSocket session " << session->channelId() << " handler failed: " << ex.what());
            }
        }
        pendingText.clear();
    }

    closeWithReason(session, closeCode, reason);
    removeSession(session);
}

void WebSocketServer::removeSession(const SessionPtr& session) {
    bool removed = false;
    std::size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        const auto it = std::find(sessions_.begin(), sessions_.end(), session);
        if (it != sessions_.end()) {
            sessions_.erase(it);
            removed = true;
        }
        remaining = sessions_.size();
    }
    if (!removed) {
        return;
    }
    if (closeHandler_) {
        closeHandler_(session);
    }
    LOG_INFO("WebSocket session " << session->channelId() << " disconnected (" << remaining << " active)");
}

bool WebSocketServer::closeWithReason(const SessionPtr& session, std::uint16_t closeCode, const std::string& reason) {
    if (!session) {
        return false;
    }
    bool expected = false;
    if (!session->closing_.compare_exchange_strong(expected, true)) {
        return false;
    }

    std::string payload;
    payload.push_back(static_cast<char>((closeCode >> 8U) & 0xFFU));
    payload.push_back(static_cast<char>(closeCode & 0xFFU));
    payload.append(reason.substr(0, 123U));

    if (!sendFrame(*session, kOpClose, payload)) {
        LOG_DEBUG("WebSocket session " << session->channelId() << " close frame not delivered");
    }

    session->active_.store(false);
    closeSessionSocket(*session);

    common::metrics::Registry::instance().incrementCounter("ws.close." + reason);
    LOG_DEBUG("ws_session_close id=" << session->channelId() << " reason=" << reason << " code=" << closeCode);
    return true;
}

// Gives queued frames (the close frame included) a bounded chance to leave,
// then unblocks and joins the writer before the descriptor is released.
void WebSocketServer::closeSessionSocket(Session& session) {
    if (!session.sendQueue_->close(kCloseDrainTimeout)) {
        LOG_DEBUG("WebSocket session " << session.channelId() << " closed with unsent frames");
    }
    const int fd = session.fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
    session.sendQueue_->shutdown();
    const int owned = session.fd_.exchange(-1);
    if (owned >= 0) {
        ::close(owned);
    }
}

bool WebSocketServer::recvAll(int fd, void* buffer, std::size_t length) {
    if (fd < 0) {
        return false;
    }
    std::size_t received = 0;
    auto* data = static_cast<std::uint8_t*>(buffer);
    while (received < length) {
        const auto bytes = ::recv(fd, data + received, length - received, 0);
        if (bytes <= 0) {
            return false;
        }
        received += static_cast<std::size_t>(bytes);
    }
    return true;
}

void WebSocketServer::keepAliveLoop() {
    std::unique_lock<std::mutex> lock(keepAliveMutex_);
    while (running_.load()) {
        const auto pingPeriod = pingPeriodMs_.load();
        keepAliveCv_.wait_for(lock, std::chrono::milliseconds(pingPeriod), [this]() { return !running_.load(); });
        if (!running_.load()) {
            break;
        }
        lock.unlock();

        const auto nowMs = steadyNowMs();
        const auto pongTimeout = pongTimeoutMs_.load();

        std::vector<SessionPtr> sessionsCopy;
        {
            std::lock_guard<std::mutex> sessionsLock(sessionsMutex_);
            sessionsCopy = sessions_;
        }

        for (const auto& session : sessionsCopy) {
            if (!session->active()) {
                continue;
            }

            const auto sinceLastPong = nowMs - std::max(session->lastPongMs_.load(), session->lastActivityMs_.load());
            if (sinceLastPong > pongTimeout) {
                if (++session->consecutivePongMisses_ >= 2) {
                    LOG_INFO("WebSocket session " << session->channelId() << " timed out after " << sinceLastPong
                                                  << "ms without pong");
                    closeWithReason(session, kCloseCodeGoingAway, "pong_timeout");
                    continue;
                }
                LOG_WARN("WebSocket session " << session->channelId() << " no pong for " << sinceLastPong << "ms");
            }
            else {
                session->consecutivePongMisses_ = 0;
            }

            if (nowMs - session->lastPingMs_.load() >= pingPeriod) {
                if (sendFrame(*session, kOpPing, std::string{})) {
                    session->lastPingMs_.store(nowMs);
                }
                else {
                    LOG_DEBUG("WebSocket session " << session->channelId() << " ping not queued");
                }
            }
        }

        lock.lock();
    }
}

}  // namespace chs::api
