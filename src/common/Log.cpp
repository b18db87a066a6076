#include "common/Log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace chs::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_outputMutex;

std::tm utcTime(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    return tm;
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void write(Level level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const auto tm = utcTime(seconds);

    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
         << "Z " << std::left << std::setw(5) << std::setfill(' ') << levelToString(level) << " [tid "
         << std::this_thread::get_id() << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(g_outputMutex);
    auto& out = (level == Level::Warn || level == Level::Error) ? std::cerr : std::cout;
    out << line.str();
    out.flush();
}

const char* levelToString(Level level) noexcept {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower{text};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    if (lower == "debug" || lower == "trace") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err" || lower == "error") {
        return Level::Error;
    }

    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace chs::log
