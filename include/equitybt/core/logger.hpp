// logger.hpp
// Thread-safe leveled logger shared by the engine, the loaders and the CLI
// Lines go to std::cerr unless a sink is installed

#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace equitybt {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    OFF = 4
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

private:
    static inline LogLevel current_level_ = LogLevel::INFO;
    static inline std::mutex mutex_;
    static inline Sink sink_;

    static std::string getTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

public:
    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::INFO:    return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR:   return "ERROR";
            default:                return "OFF";
        }
    }

    static void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_level_ = level;
    }

    static LogLevel getLevel() {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_level_;
    }

    // Replaces stderr output; pass an empty function to restore it
    static void setSink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    // A sink runs outside the lock and may log itself
    static void log(LogLevel level, const std::string& message) {
        Sink sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < current_level_ || level == LogLevel::OFF) return;
            if (!sink_) {
                std::cerr << "[" << getTimestamp() << "] "
                          << "[" << levelToString(level) << "] "
                          << message << std::endl;
                return;
            }
            sink = sink_;
        }
        sink(level, message);
    }

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }
};

} // namespace equitybt
