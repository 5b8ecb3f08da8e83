#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>

namespace proverd::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

enum class LogFormat {
    kText,
    kJson
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

bool ParseLogLevel(const std::string& value, LogLevel& level);
bool ParseLogFormat(const std::string& value, LogFormat& format);

using LogFields = std::unordered_map<std::string, std::string>;

struct LogMessage {
    LogLevel level;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
    LogFormat format = LogFormat::kJson;
};

// Sink shared by every component of a process. Implementations must accept
// concurrent calls from request threads.
class Logger {
public:
    virtual ~Logger() = default;
    virtual void Log(const LogMessage& message) = 0;

    void Debug(const std::string& message, LogFields fields = {});
    void Info(const std::string& message, LogFields fields = {});
    void Warn(const std::string& message, LogFields fields = {});
    void Error(const std::string& message, LogFields fields = {});
};

class StreamLogger : public Logger {
public:
    StreamLogger(std::ostream& out, LogConfig config);

    void Log(const LogMessage& message) override;

private:
    std::ostream& out_;
    LogConfig config_;
    std::mutex mutex_;
};

}  // namespace proverd::utils
