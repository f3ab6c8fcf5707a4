/**
 * @file logger.hpp
 * @brief Console log gate
 * 
 * Lines keep the "[TAG] message" form. debug/info go to stdout,
 * warn/error to stderr. Filtered levels write into a null stream.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdint>
#include <ostream>
#include <string>

enum class LogLevel : uint8_t {
    LOG_DEBUG = 0,
    LOG_INFO = 1,
    LOG_WARN = 2,
    LOG_ERROR = 3
};

class Logger {
public:
    /**
     * @brief Apply logging settings
     * @param level Minimum level printed
     * @param console_output When false only errors are printed
     */
    static void configure(LogLevel level, bool console_output);
    
    /**
     * @brief Map "debug" / "info" / "warn" / "error" to a level
     * @return false for unknown names (level untouched)
     */
    static bool parseLevel(const std::string& name, LogLevel& level);
    
    static bool enabled(LogLevel level);
    
    static std::ostream& debug();
    static std::ostream& info();
    static std::ostream& warn();
    static std::ostream& error();

private:
    static LogLevel level_;
    static bool console_output_;
    
    static std::ostream& stream(LogLevel level);
};

#endif // LOGGER_HPP
