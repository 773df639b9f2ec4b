#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <string>

namespace verdict::utils {

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
    std::atomic<LogLevel> min_level{LogLevel::kInfo};
    std::mutex mutex;
};

inline LogConfig& GlobalLogConfig() {
    static LogConfig config;
    return config;
}

inline void SetMinLogLevel(LogLevel level) {
    GlobalLogConfig().min_level = level;
}

// Writes "[tag] message" to stderr. Lines from concurrent workers never interleave.
inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    auto& config = GlobalLogConfig();
    if (level < config.min_level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(config.mutex);
    std::cerr << "[" << tag << "] ";
    if (level >= LogLevel::kWarn) {
        std::cerr << ToString(level) << ": ";
    }
    std::cerr << message << std::endl;
}

}  // namespace verdict::utils
