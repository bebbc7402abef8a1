#include "log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace orbitwatch {
namespace {
    std::mutex g_log_mutex;
    std::atomic<LogLevel> g_level{LogLevel::Info};

    std::tm LocalTime(std::time_t t) {
        std::tm out{};
#if defined(_WIN32)
        localtime_s(&out, &t);
#else
        localtime_r(&t, &out);
#endif
        return out;
    }
} // namespace

void SetLogLevel(LogLevel level) { g_level = level; }
LogLevel GetLogLevel() { return g_level; }

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

void Log(LogLevel level, const std::string& message) {
    const LogLevel threshold = g_level;
    if (threshold == LogLevel::Off || level < threshold) {
        return;
    }

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm = LocalTime(now);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    os << "[" << std::put_time(&tm, "%H:%M:%S") << "]"
       << "[" << ToString(level) << "] "
       << message << std::endl;
}

} // namespace orbitwatch
