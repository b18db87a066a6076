#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace chs::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void write(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace chs::log

#define CHS_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::chs::log::shouldLog(level)) {                                                \
            std::ostringstream chs_log_stream__;                                           \
            chs_log_stream__ << expr;                                                      \
            ::chs::log::write(level, chs_log_stream__.str());                              \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) CHS_LOG_IMPL(::chs::log::Level::Debug, expr)
#define LOG_INFO(expr) CHS_LOG_IMPL(::chs::log::Level::Info, expr)
#define LOG_WARN(expr) CHS_LOG_IMPL(::chs::log::Level::Warn, expr)
#define LOG_ERR(expr) CHS_LOG_IMPL(::chs::log::Level::Error, expr)
