#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace safexec::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

using LogSink = std::function<void(const LogMessage&)>;

// Process-wide logger. Messages at or above the configured level go to
// stderr as "[tag] message key=value"; sinks see every message regardless.
class Logger {
public:
    static Logger& Instance();

    void Configure(const LogConfig& config);
    int AddSink(LogSink sink);
    void RemoveSink(int id);

    void Log(LogLevel level,
             const std::string& tag,
             const std::string& message,
             std::unordered_map<std::string, std::string> fields = {});

private:
    Logger() = default;

    LogConfig config_;
    std::vector<std::pair<int, LogSink>> sinks_;
    int next_sink_id_ = 1;
    std::mutex mutex_;
};

inline void LogDebug(const std::string& tag,
                     const std::string& message,
                     std::unordered_map<std::string, std::string> fields = {}) {
    Logger::Instance().Log(LogLevel::kDebug, tag, message, std::move(fields));
}

inline void LogInfo(const std::string& tag,
                    const std::string& message,
                    std::unordered_map<std::string, std::string> fields = {}) {
    Logger::Instance().Log(LogLevel::kInfo, tag, message, std::move(fields));
}

inline void LogWarn(const std::string& tag,
                    const std::string& message,
                    std::unordered_map<std::string, std::string> fields = {}) {
    Logger::Instance().Log(LogLevel::kWarn, tag, message, std::move(fields));
}

inline void LogError(const std::string& tag,
                     const std::string& message,
                     std::unordered_map<std::string, std::string> fields = {}) {
    Logger::Instance().Log(LogLevel::kError, tag, message, std::move(fields));
}

}  // namespace safexec::utils
