#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace streamready {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;

void Logger::initialize(LogLevel level) {
  level_ = level;
  if (!initialized_) {
    initialized_ = true;
    info(std::string("Logger initialized at level ") + levelName(level));
  }
}

void Logger::info(const std::string &message) {
  if (enabled(LogLevel::INFO)) {
    std::cout << "[INFO] " << message << std::endl;
  }
}

void Logger::warn(const std::string &message) {
  if (enabled(LogLevel::WARN)) {
    std::cout << "[WARN] " << message << std::endl;
  }
}

void Logger::error(const std::string &message) {
  if (enabled(LogLevel::ERROR)) {
    std::cerr << "[ERROR] " << message << std::endl;
  }
}

void Logger::debug(const std::string &message) {
  if (enabled(LogLevel::DEBUG)) {
    std::cout << "[DEBUG] " << message << std::endl;
  }
}

void Logger::setLevel(LogLevel level) { level_ = level; }

LogLevel Logger::getLevel() { return level_; }

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") {
    return LogLevel::DEBUG;
  }
  if (upper == "WARN" || upper == "WARNING") {
    return LogLevel::WARN;
  }
  if (upper == "ERROR") {
    return LogLevel::ERROR;
  }
  return LogLevel::INFO;
}

const char *Logger::levelName(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "INFO";
}

bool Logger::enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(level_);
}

} // namespace utils
} // namespace streamready
