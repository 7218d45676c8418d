#pragma once

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <string>

namespace reagent::utils {

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

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
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

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

namespace detail {

inline LogConfig& GlobalLogConfig() {
    static LogConfig config{};
    return config;
}

inline std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace detail

inline void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> guard(detail::LogMutex());
    detail::GlobalLogConfig() = config;
}

// Writes "[tag] message" to stderr, in the format the tools already use.
inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> guard(detail::LogMutex());
    if (level < detail::GlobalLogConfig().min_level) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level >= LogLevel::kWarn) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace reagent::utils
