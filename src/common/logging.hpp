#pragma once

/**
 * Minimal printf-style logging used across the console. Each source file
 * defines its own `TAG` and logs through the macros below, e.g.
 *
 *   #define TAG "2048"
 *   LOG_DEBUG(TAG, "Input received: %s", direction_to_str(dir));
 *
 * Messages below the currently configured level are dropped.
 */
enum class LogLevel {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
};

void set_log_level(LogLevel level);
LogLevel get_log_level();
const char *log_level_to_str(LogLevel level);

void log_message(LogLevel level, const char *tag, const char *format, ...)
    __attribute__((format(printf, 3, 4)));

#define LOG_DEBUG(tag, ...) log_message(LogLevel::Debug, tag, __VA_ARGS__)
#define LOG_INFO(tag, ...) log_message(LogLevel::Info, tag, __VA_ARGS__)
#define LOG_WARN(tag, ...) log_message(LogLevel::Warn, tag, __VA_ARGS__)
#define LOG_ERROR(tag, ...) log_message(LogLevel::Error, tag, __VA_ARGS__)
