#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <functional>

namespace rcs::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    // Sink menerima level dan baris yang sudah diformat (tanpa newline)
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static LogLevel levelFromString(const std::string& name);

    static void setSink(Sink sink);
    static void resetSink();

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

private:
    static LogLevel current_level_;
    static Sink sink_;
    static std::mutex mutex_;

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) return;

        std::string message = formatString(format, std::forward<Args>(args)...);

        if (sink_) {
            sink_(level, message);
            return;
        }

        // Get current time
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

        std::cout << "[" << oss.str() << "] [" << levelName(level) << "] " << message << std::endl;
    }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
        }
        return "";
    }

    // Replaces each "{}" in order; surplus arguments are dropped
    template<typename T>
    static std::string formatString(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string formatString(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string partial = format.substr(0, pos) + oss.str();
            return partial + formatString(format.substr(pos + 2), std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }
};

} // namespace rcs::core
