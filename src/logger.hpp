#ifndef GATEWAY_LOGGER_HPP
#define GATEWAY_LOGGER_HPP

#include <string>

namespace gateway {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

bool parseLogLevel(const std::string& name, LogLevel& out);
const char* logLevelName(LogLevel level);

// Process-wide logger. Error log goes to stdout unless a file is
// configured; the access log falls back to the error log sink.
class Logger {
public:
    static void setLevel(LogLevel level);

    // "stdout", "stderr", empty or a file path (opened in append mode).
    static void openErrorLog(const std::string& target);
    static void openAccessLog(const std::string& target);
    static void disableAccessLog();
    static void close();

    static void log(LogLevel level, const std::string& message);
    static void access(const std::string& line);
};

inline void logDebug(const std::string& message) { Logger::log(LogLevel::Debug, message); }
inline void logInfo(const std::string& message) { Logger::log(LogLevel::Info, message); }
inline void logWarn(const std::string& message) { Logger::log(LogLevel::Warn, message); }
inline void logError(const std::string& message) { Logger::log(LogLevel::Error, message); }

} // namespace gateway

#endif // GATEWAY_LOGGER_HPP
