#include "Log.hpp"
#include <cstdio>

namespace {
    class StderrLogger : public ILogger {
    public:
        void write(LogLevel level, std::string_view tag, std::string_view msg) override {
            static const char* names[] = { "DEBUG", "INFO ", "WARN ", "ERROR" };
            std::fprintf(stderr, "[%s][%.*s] %.*s\n", names[(int)level],
                (int)tag.size(), tag.data(), (int)msg.size(), msg.data());
        }
    };

    StderrLogger g_stderr;
    ILogger* g_logger = &g_stderr;
    LogLevel g_minLevel = LogLevel::Info;

    void dispatch(LogLevel level, std::string_view tag, std::string_view msg) {
        if (level < g_minLevel) return;
        g_logger->write(level, tag, msg);
    }
}

void Log::setLogger(ILogger* logger) { g_logger = logger ? logger : &g_stderr; }
void Log::setMinLevel(LogLevel level) { g_minLevel = level; }
LogLevel Log::minLevel() { return g_minLevel; }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::Debug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::Info,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::Warn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::Error, tag, msg); }
