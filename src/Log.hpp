#pragma once
#include <string_view>

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Sink for log lines. Default one writes to stderr.
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void write(LogLevel level, std::string_view tag, std::string_view msg) = 0;
};

class Log {
public:
    Log() = delete;

    static void setLogger(ILogger* logger); // nullptr restores stderr
    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
};
