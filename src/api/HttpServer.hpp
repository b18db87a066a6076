#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "api/Router.hpp"

namespace chs::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Blocking HTTP/1.1 server: one accept loop per worker thread, one request
// per connection.
class HttpServer {
public:
    struct CorsConfig {
        bool enabled{false};
        std::string origin;
    };

    // Offered every request before routing. Returning true means the handler
    // took ownership of clientFd.
    using UpgradeHandler = std::function<bool(int clientFd, const Request& request)>;

    HttpServer(Endpoint endpoint, std::size_t threadCount, const Router& router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();
    void stop();
    void wait();

    // Port actually bound by start(); differs from the configured one when
    // that was 0.
    std::uint16_t port() const noexcept { return boundPort_; }

    void setCorsConfig(CorsConfig config);
    void setUpgradeHandler(UpgradeHandler handler);

private:
    void workerLoop(std::size_t workerId);
    void handleClient(int clientFd);
    void writeResponse(int clientFd, const Response& response) const;

    Endpoint endpoint_;
    std::size_t threadCount_;
    const Router& router_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    int serverFd_ = -1;
    std::uint16_t boundPort_ = 0;
    CorsConfig corsConfig_{};
    UpgradeHandler upgradeHandler_{};
};

}  // namespace chs::api
