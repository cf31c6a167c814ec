#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

namespace safexec::utils {

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

void Logger::Configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

int Logger::AddSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int id = next_sink_id_++;
    sinks_.emplace_back(id, std::move(sink));
    return id;
}

void Logger::RemoveSink(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove_if(sinks_.begin(), sinks_.end(), [id](const auto& entry) {
        return entry.first == id;
    }), sinks_.end());
}

void Logger::Log(LogLevel level,
                 const std::string& tag,
                 const std::string& message,
                 std::unordered_map<std::string, std::string> fields) {
    const LogMessage entry{level, tag, message, std::move(fields)};
    std::vector<std::pair<int, LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
        if (static_cast<int>(level) >= static_cast<int>(config_.min_level)) {
            std::cerr << "[" << tag << "] ";
            if (level == LogLevel::kWarn || level == LogLevel::kError) {
                std::cerr << ToString(level) << " ";
            }
            std::cerr << message;
            // sorted so lines are stable between runs
            const std::map<std::string, std::string> ordered(entry.fields.begin(), entry.fields.end());
            for (const auto& [key, value] : ordered) {
                std::cerr << " " << key << "=" << value;
            }
            std::cerr << std::endl;
        }
    }
    for (const auto& [id, sink] : sinks) {
        sink(entry);
    }
}

}  // namespace safexec::utils
