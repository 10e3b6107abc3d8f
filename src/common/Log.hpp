#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace kvault::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Receives every record that passes the level filter. The default sink writes
// to stdout (Debug/Info) or stderr (Warn/Error).
using Sink = std::function<void(Level, const std::string& line)>;

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

void setSink(Sink sink);
void resetSink();

class ScopedLevel {
public:
    explicit ScopedLevel(Level level) noexcept : previous_(getLevel()) { setLevel(level); }
    ~ScopedLevel() { setLevel(previous_); }

    ScopedLevel(const ScopedLevel&) = delete;
    ScopedLevel& operator=(const ScopedLevel&) = delete;

private:
    Level previous_;
};

}  // namespace kvault::log

#define KV_LOG_IMPL(level, expr)                                                           \
    do {                                                                                   \
        if (::kvault::log::shouldLog(level)) {                                             \
            std::ostringstream kv_log_stream__;                                            \
            kv_log_stream__ << expr;                                                       \
            ::kvault::log::log(level, kv_log_stream__.str());                              \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) KV_LOG_IMPL(::kvault::log::Level::Debug, expr)
#define LOG_INFO(expr) KV_LOG_IMPL(::kvault::log::Level::Info, expr)
#define LOG_WARN(expr) KV_LOG_IMPL(::kvault::log::Level::Warn, expr)
#define LOG_ERR(expr) KV_LOG_IMPL(::kvault::log::Level::Error, expr)
