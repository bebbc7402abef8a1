#ifndef ORBITWATCH_LOG_HPP
#define ORBITWATCH_LOG_HPP

#include <string>

namespace orbitwatch {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Off   = 5
};

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

const char* ToString(LogLevel level);

/**
 * @brief Writes one timestamped line. Warn and above go to std::cerr.
 * Safe to call from the analysis workers.
 */
void Log(LogLevel level, const std::string& message);

} // namespace orbitwatch

// Convenience macros
#define ORBITWATCH_LOG_TRACE(msg) ::orbitwatch::Log(::orbitwatch::LogLevel::Trace, (msg))
#define ORBITWATCH_LOG_DEBUG(msg) ::orbitwatch::Log(::orbitwatch::LogLevel::Debug, (msg))
#define ORBITWATCH_LOG_INFO(msg)  ::orbitwatch::Log(::orbitwatch::LogLevel::Info,  (msg))
#define ORBITWATCH_LOG_WARN(msg)  ::orbitwatch::Log(::orbitwatch::LogLevel::Warn,  (msg))
#define ORBITWATCH_LOG_ERROR(msg) ::orbitwatch::Log(::orbitwatch::LogLevel::Error, (msg))

#endif // ORBITWATCH_LOG_HPP
