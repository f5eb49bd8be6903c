/**
 * @file debug.hpp
 * @brief Leveled stderr logging and slow-scope timers.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace MediaOrganizer {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::atomic<int>& logThreshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::Info)};
    return threshold;
}

inline void setLogLevel(LogLevel level) { logThreshold() = static_cast<int>(level); }

inline bool logEnabled(LogLevel level) { return static_cast<int>(level) >= logThreshold().load(); }

/// Parses "debug", "info", "warn"/"warning" or "error"; anything else is Info.
inline LogLevel parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

inline long long getTimestampMs() {
    static auto startTime = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
}

inline const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

inline void writeLogLine(LogLevel level, const std::string& text) {
    static std::mutex writeMutex;
    std::lock_guard<std::mutex> lock(writeMutex);
    std::cerr << "[" << getTimestampMs() << "ms] [" << logLevelTag(level) << "] " << text << std::endl;
}

} // namespace MediaOrganizer

#define MO_LOG(level, msg) do { \
    if (::MediaOrganizer::logEnabled(level)) { \
        std::ostringstream _log_oss; _log_oss << msg; \
        ::MediaOrganizer::writeLogLine(level, _log_oss.str()); \
    } } while(0)

#define DEBUG_LOG(msg) MO_LOG(::MediaOrganizer::LogLevel::Debug, msg)
#define LOG_INFO(msg)  MO_LOG(::MediaOrganizer::LogLevel::Info, msg)
#define LOG_WARN(msg)  MO_LOG(::MediaOrganizer::LogLevel::Warn, msg)
#define LOG_ERROR(msg) MO_LOG(::MediaOrganizer::LogLevel::Error, msg)

namespace MediaOrganizer {

// Scoped timer that logs if operation exceeds threshold
class ScopedTimer {
public:
    ScopedTimer(const char* name, int thresholdMs = 50)
        : m_name(name), m_thresholdMs(thresholdMs), m_start(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_start).count();
        if (elapsed >= m_thresholdMs) {
            LOG_WARN("SLOW: " << m_name << " took " << elapsed << "ms");
        }
    }
private:
    const char* m_name;
    int m_thresholdMs;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace MediaOrganizer

#define MO_TIMER_CONCAT_INNER(a, b) a##b
#define MO_TIMER_CONCAT(a, b) MO_TIMER_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) ::MediaOrganizer::ScopedTimer MO_TIMER_CONCAT(_timer_, __LINE__)(name)
#define SCOPED_TIMER_THRESHOLD(name, ms) ::MediaOrganizer::ScopedTimer MO_TIMER_CONCAT(_timer_, __LINE__)(name, ms)
