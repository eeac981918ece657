#include "logging.hpp"

#include <cstdarg>
#include <cstdio>

static LogLevel current_level = LogLevel::Info;

void set_log_level(LogLevel level) { current_level = level; }

LogLevel get_log_level() { return current_level; }

const char *log_level_to_str(LogLevel level)
{
        switch (level) {
        case LogLevel::Debug:
                return "DEBUG";
        case LogLevel::Info:
                return "INFO";
        case LogLevel::Warn:
                return "WARN";
        case LogLevel::Error:
                return "ERROR";
        default:
                return "UNKNOWN";
        }
}

void log_message(LogLevel level, const char *tag, const char *format, ...)
{
        if (level < current_level) {
                return;
        }

        // The whole line is formatted first so that messages from the
        // platform layer and from the games do not interleave mid-line.
        char buffer[512];
        va_list args;
        va_start(args, format);
        vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        fprintf(stderr, "[%s] [%s] %s\n", log_level_to_str(level), tag,
                buffer);
}
