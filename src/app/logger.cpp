/**
 * @file logger.cpp
 * @brief Console log gate implementation
 */

#include "logger.hpp"
#include <iostream>

LogLevel Logger::level_ = LogLevel::LOG_INFO;
bool Logger::console_output_ = true;

void Logger::configure(LogLevel level, bool console_output) {
    level_ = level;
    console_output_ = console_output;
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    if (name == "debug") {
        level = LogLevel::LOG_DEBUG;
    } else if (name == "info") {
        level = LogLevel::LOG_INFO;
    } else if (name == "warn" || name == "warning") {
        level = LogLevel::LOG_WARN;
    } else if (name == "error") {
        level = LogLevel::LOG_ERROR;
    } else {
        return false;
    }
    return true;
}

bool Logger::enabled(LogLevel level) {
    if (level == LogLevel::LOG_ERROR) {
        return true;
    }
    return console_output_ && level >= level_;
}

std::ostream& Logger::debug() { return stream(LogLevel::LOG_DEBUG); }
std::ostream& Logger::info()  { return stream(LogLevel::LOG_INFO); }
std::ostream& Logger::warn()  { return stream(LogLevel::LOG_WARN); }
std::ostream& Logger::error() { return stream(LogLevel::LOG_ERROR); }

std::ostream& Logger::stream(LogLevel level) {
    static std::ostream null_stream(nullptr);
    
    if (!enabled(level)) {
        null_stream.clear();
        return null_stream;
    }
    return level >= LogLevel::LOG_WARN ? std::cerr : std::cout;
}
