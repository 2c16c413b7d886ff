#pragma once

#include <string>

namespace streamready {
namespace utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static void initialize(LogLevel level = LogLevel::INFO);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Accepts DEBUG, INFO, WARN/WARNING, ERROR (case-insensitive); anything else maps to INFO
    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);

private:
    static bool enabled(LogLevel level);

    static bool initialized_;
    static LogLevel level_;
};

} // namespace utils
} // namespace streamready
