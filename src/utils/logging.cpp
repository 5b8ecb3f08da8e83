#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

#include "nlohmann/json.hpp"

namespace proverd::utils {
namespace {

std::string Lowered(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

}  // namespace

bool ParseLogLevel(const std::string& value, LogLevel& level) {
    const auto lowered = Lowered(value);
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

bool ParseLogFormat(const std::string& value, LogFormat& format) {
    const auto lowered = Lowered(value);
    if (lowered == "text") {
        format = LogFormat::kText;
    } else if (lowered == "json") {
        format = LogFormat::kJson;
    } else {
        return false;
    }
    return true;
}

void Logger::Debug(const std::string& message, LogFields fields) {
    Log(LogMessage{LogLevel::kDebug, message, std::move(fields)});
}

void Logger::Info(const std::string& message, LogFields fields) {
    Log(LogMessage{LogLevel::kInfo, message, std::move(fields)});
}

void Logger::Warn(const std::string& message, LogFields fields) {
    Log(LogMessage{LogLevel::kWarn, message, std::move(fields)});
}

void Logger::Error(const std::string& message, LogFields fields) {
    Log(LogMessage{LogLevel::kError, message, std::move(fields)});
}

StreamLogger::StreamLogger(std::ostream& out, LogConfig config)
    : out_(out)
    , config_(config) {}

void StreamLogger::Log(const LogMessage& message) {
    if (message.level < config_.min_level) {
        return;
    }
    std::string line;
    if (config_.format == LogFormat::kJson) {
        nlohmann::json json = {
            {"time", Timestamp()},
            {"level", ToString(message.level)},
            {"msg", message.message}
        };
        for (const auto& [key, value] : message.fields) {
            json[key] = value;
        }
        line = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        // Sorted so that text lines are stable across runs.
        const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
        std::ostringstream oss;
        oss << Timestamp() << " [" << ToString(message.level) << "] " << message.message;
        for (const auto& [key, value] : sorted) {
            oss << ' ' << key << '=' << value;
        }
        line = oss.str();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
}

}  // namespace proverd::utils
