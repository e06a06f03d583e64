#pragma once
#include <mutex>
#include <string>

namespace Clawweb {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_INFO    = 1 << 0,
    LOG_WARN    = 1 << 1,
    LOG_ERROR   = 1 << 2,
    LOG_SUCCESS = 1 << 3,
    LOG_ALL     = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS
};

// All levels go to stderr; stdout carries links-mode output only.
class Logger {
public:
    static void set_level(int level);
    static int  level();
    static void info(const std::string& message);
    static void success(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    static void write(int level, const char* color, const char* tag, const std::string& message);

    static int        level_;
    static std::mutex mutex_;
};

}  // namespace Core
}  // namespace Clawweb
