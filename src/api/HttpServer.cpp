#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"

namespace chs::api {

namespace {

constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
constexpr std::size_t kMaxBodyBytes = 1024 * 1024;

std::string describeErrno(int err) {
    return std::strerror(err);
}

std::string formatAddress(const Endpoint& endpoint) {
    if (endpoint.address.empty()) {
        return std::string("0.0.0.0:") + std::to_string(endpoint.port);
    }
    return endpoint.address + ':' + std::to_string(endpoint.port);
}

std::string trim(const std::string& input) {
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return input.substr(start, end - start);
}

std::string toLower(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

void parseHead(const std::string& head, Request& request) {
    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::istringstream lineStream(line);
    lineStream >> request.method >> request.target >> request.version;

    const auto queryPos = request.target.find('?');
    if (queryPos != std::string::npos) {
        request.path = request.target.substr(0, queryPos);
        request.query = request.target.substr(queryPos + 1);
    }
    else {
        request.path = request.target;
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        const auto colonPos = line.find(':');
        if (colonPos == std::string::npos) {
            continue;
        }
        request.headers.emplace(toLower(trim(line.substr(0, colonPos))), trim(line.substr(colonPos + 1)));
    }
}

std::size_t contentLength(const Request& request) {
    const auto it = request.headers.find("content-length");
    if (it == request.headers.end()) {
        return 0;
    }
    std::size_t length = 0;
    const auto* begin = it->second.data();
    const auto* end = begin + it->second.size();
    const auto [ptr, ec] = std::from_chars(begin, end, length);
    if (ec != std::errc() || ptr != end) {
        return 0;
    }
    return length;
}

}  // namespace

HttpServer::HttpServer(Endpoint endpoint, std::size_t threadCount, const Router& router)
    : endpoint_(std::move(endpoint)), threadCount_(threadCount ? threadCount : 1), router_(router) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setCorsConfig(CorsConfig config) { corsConfig_ = std::move(config); }

void HttpServer::setUpgradeHandler(UpgradeHandler handler) { upgradeHandler_ = std::move(handler); }

void HttpServer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    serverFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd_ < 0) {
        running_.store(false);
        throw std::runtime_error("Failed to create server socket: " + describeErrno(errno));
    }

    int opt = 1;
    ::setsockopt(serverFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint_.port);
    if (endpoint_.address.empty() || endpoint_.address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else {
        if (::inet_pton(AF_INET, endpoint_.address.c_str(), &addr.sin_addr) != 1) {
            ::close(serverFd_);
            serverFd_ = -1;
            running_.store(false);
            throw std::runtime_error("Invalid listen address: " + endpoint_.address);
        }
    }

    if (::bind(serverFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("Failed to bind " + formatAddress(endpoint_) + ": " + message);
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(serverFd_, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    }

    if (::listen(serverFd_, SOMAXCONN) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("Failed to listen: " + message);
    }

    LOG_INFO("HTTP server listening on " << formatAddress(Endpoint{endpoint_.address, boundPort_}) << " with "
                                         << threadCount_ << " workers");

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { workerLoop(i); });
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (serverFd_ >= 0) {
        ::shutdown(serverFd_, SHUT_RDWR);
        ::close(serverFd_);
        serverFd_ = -1;
    }

    wait();
}

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void HttpServer::workerLoop(std::size_t workerId) {
    LOG_DEBUG("Worker " << workerId << " started");

    while (running_.load()) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = ::accept(serverFd_, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientFd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EBADF || errno == EINVAL) {
                break;
            }
            LOG_WARN("accept failed: " << describeErrno(errno));
            continue;
        }

        handleClient(clientFd);
    }

    LOG_DEBUG("Worker " << workerId << " stopped");
}

void HttpServer::handleClient(int clientFd) {
    std::string raw;
    raw.reserve(1024);
    char buffer[4096];

    std::size_t headerEnd = std::string::npos;
    while ((headerEnd = raw.find("\r\n\r\n")) == std::string::npos) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        raw.append(buffer, static_cast<std::size_t>(bytes));
        if (raw.size() > kMaxHeaderBytes) {
            break;
        }
    }

    if (headerEnd == std::string::npos) {
        ::shutdown(clientFd, SHUT_RDWR);
        ::close(clientFd);
        return;
    }

    Request request{};
    parseHead(raw.substr(0, headerEnd), request);

    if (upgradeHandler_ && upgradeHandler_(clientFd, request)) {
        return;
    }

    const auto length = contentLength(request);
    if (length > kMaxBodyBytes) {
        Response response;
        chs::http::json_error(response, 400, chs::http::errors::validation_failed, "request body too large");
        writeResponse(clientFd, response);
        return;
    }

    request.body = raw.substr(headerEnd + 4);
    while (request.body.size() < length) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        request.body.append(buffer, static_cast<std::size_t>(bytes));
    }
    if (request.body.size() > length) {
        request.body.resize(length);
    }

    writeResponse(clientFd, router_.handle(std::move(request)));
}

void HttpServer::writeResponse(int clientFd, const Response& responseData) const {
    std::ostringstream response;
    response << "HTTP/1.1 " << responseData.statusCode << ' ' << responseData.statusText << "\r\n";
    const std::string contentType = responseData.contentType.empty() ? "application/json" : responseData.contentType;
    response << "Content-Type: " << contentType << "\r\n";
    for (const auto& header : responseData.headers) {
        if (!header.first.empty()) {
            response << header.first << ": " << header.second << "\r\n";
        }
    }
    if (corsConfig_.enabled && !corsConfig_.origin.empty()) {
        response << "Access-Control-Allow-Origin: " << corsConfig_.origin << "\r\n";
        response << "Vary: Origin\r\n";
        response << "Access-Control-Allow-Headers: Content-Type\r\n";
    }
    response << "Content-Length: " << responseData.body.size() << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << responseData.body;

    const auto responseStr = response.str();
    const char* data = responseStr.data();
    std::size_t remaining = responseStr.size();

    while (remaining > 0) {
        const auto written = ::send(clientFd, data, remaining, MSG_NOSIGNAL);
        if (written <= 0) {
            break;
        }
        remaining -= static_cast<std::size_t>(written);
        data += written;
    }

    ::shutdown(clientFd, SHUT_RDWR);
    ::close(clientFd);
}

}  // namespace chs::api
