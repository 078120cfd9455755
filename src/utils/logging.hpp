#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace shellbox::utils {

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

inline LogLevel ParseLogLevel(std::string value, LogLevel fallback = LogLevel::kInfo) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (value == "debug") {
        return LogLevel::kDebug;
    }
    if (value == "info") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

namespace detail {

inline std::atomic<int>& MinLevel() {
    static std::atomic<int> level{static_cast<int>(LogLevel::kInfo)};
    return level;
}

inline std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace detail

inline void ConfigureLogging(const LogConfig& config) {
    detail::MinLevel().store(static_cast<int>(config.min_level));
}

inline bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= detail::MinLevel().load();
}

inline void Write(const LogMessage& msg) {
    if (!IsEnabled(msg.level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << msg.tag << "] " << ToString(msg.level) << " " << msg.message;
    for (const auto& [key, value] : msg.fields) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(detail::SinkMutex());
    std::cerr << line.str() << std::endl;
}

inline void Log(LogLevel level,
                const std::string& tag,
                const std::string& message,
                std::vector<std::pair<std::string, std::string>> fields = {}) {
    if (!IsEnabled(level)) {
        return;
    }
    Write(LogMessage{level, tag, message, std::move(fields)});
}

inline void LogDebug(const std::string& tag, const std::string& message,
                     std::vector<std::pair<std::string, std::string>> fields = {}) {
    Log(LogLevel::kDebug, tag, message, std::move(fields));
}

inline void LogInfo(const std::string& tag, const std::string& message,
                    std::vector<std::pair<std::string, std::string>> fields = {}) {
    Log(LogLevel::kInfo, tag, message, std::move(fields));
}

inline void LogWarn(const std::string& tag, const std::string& message,
                    std::vector<std::pair<std::string, std::string>> fields = {}) {
    Log(LogLevel::kWarn, tag, message, std::move(fields));
}

inline void LogError(const std::string& tag, const std::string& message,
                     std::vector<std::pair<std::string, std::string>> fields = {}) {
    Log(LogLevel::kError, tag, message, std::move(fields));
}

}  // namespace shellbox::utils
