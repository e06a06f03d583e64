#include "logger.hpp"
#include <iostream>
#include <unistd.h>

namespace Clawweb {
namespace Core {

int Logger::level_ = LogLevel::LOG_ALL;

std::mutex Logger::mutex_;

namespace {
const char* RESET  = "\033[0m";
const char* RED    = "\033[31m";
const char* GREEN  = "\033[32m";
const char* YELLOW = "\033[33m";
const char* BLUE   = "\033[34m";

bool use_color() {
    static const bool tty = ::isatty(STDERR_FILENO) != 0;
    return tty;
}
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::write(int level, const char* color, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;

    if (use_color()) {
        std::cerr << color << tag << RESET << message << std::endl;
    }
    else {
        std::cerr << tag << message << std::endl;
    }
}

void Logger::info(const std::string& message) {
    write(LogLevel::LOG_INFO, BLUE, "[INFO] ", message);
}

void Logger::success(const std::string& message) {
    write(LogLevel::LOG_SUCCESS, GREEN, "[SUCCESS] ", message);
}

void Logger::warn(const std::string& message) {
    write(LogLevel::LOG_WARN, YELLOW, "[WARN] ", message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::LOG_ERROR, RED, "[ERROR] ", message);
}

}  // namespace Core
}  // namespace Clawweb
