#pragma once

#include <string>
#include <functional>
#include <cstdint>

namespace qkdsim {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

bool parseLogLevel(const std::string& name, LogLevel& out);
const char* logLevelName(LogLevel level);

class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void enableConsole(bool enable);
    // Files rotate to path.1 .. path.(maxFiles-1) once they pass maxFileSize bytes.
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);

    static void log(LogLevel level, const std::string& category, const std::string& msg);

    // Invoked under the logger lock; the callback must not log.
    static void onLog(std::function<void(const LogEntry&)> callback);

    static void setAllowSensitiveLogging(bool allow);

    // Key material redaction
    static std::string redactKeyBits(const std::string& bits);
};

#define LOG_TRACE(msg) qkdsim::utils::Logger::trace(msg)
#define LOG_DEBUG(msg) do { if (qkdsim::utils::Logger::getLevel() <= qkdsim::utils::LogLevel::DEBUG) qkdsim::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) qkdsim::utils::Logger::info(msg)
#define LOG_WARN(msg) qkdsim::utils::Logger::warn(msg)
#define LOG_ERROR(msg) qkdsim::utils::Logger::error(msg)
#define LOG_FATAL(msg) qkdsim::utils::Logger::fatal(msg)

}
}
