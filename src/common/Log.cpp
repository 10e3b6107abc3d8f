#include "common/Log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace kvault::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_sinkMutex;
Sink g_sink;

const char* kLevelLabels[] = {"DEBUG", "INFO", "WARN", "ERROR"};

std::tm safeGmtime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

// Bar data is UTC end to end, so log lines are stamped in UTC as well.
std::string formatLine(Level level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const auto tm = safeGmtime(seconds);

    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
         << milliseconds.count() << "Z " << std::setw(5) << std::setfill(' ') << std::left
         << levelToString(level) << " [" << std::this_thread::get_id() << "] " << message;
    return line.str();
}

void writeDefault(Level level, const std::string& line) {
    auto& out = (level == Level::Warn || level == Level::Error) ? std::cerr : std::cout;
    out << line << '\n';
    if (level == Level::Error) {
        out.flush();
    }
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void log(Level level, const std::string& message) {
    const auto line = formatLine(level, message);

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_sink) {
        g_sink(level, line);
        return;
    }
    writeDefault(level, line);
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = std::move(sink);
}

void resetSink() {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = nullptr;
}

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index < (sizeof(kLevelLabels) / sizeof(kLevelLabels[0]))) {
        return kLevelLabels[index];
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
    if (lower == "err" || lower == "error" || lower == "critical") {
        return Level::Error;
    }

    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace kvault::log
