#include "rcs/core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace rcs::core {

LogLevel Logger::current_level_ = LogLevel::INFO;
Logger::Sink Logger::sink_;
std::mutex Logger::mutex_;

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

LogLevel Logger::levelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::resetSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = nullptr;
}

} // namespace rcs::core
