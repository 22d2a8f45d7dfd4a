#pragma once
#include <cstdio>
#include <cstdarg>

namespace skyline {

enum class LogLevel { Debug, Info, Warn, Error };

void log_set_level(LogLevel level);
LogLevel log_level();

/* Thread-safe: one line per call, tagged with a short thread id so
   interleaved builds and HTTP connections stay readable. */
void log_msg(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace skyline

#define LOG_DEBUG(...) ::skyline::log_msg(::skyline::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  ::skyline::log_msg(::skyline::LogLevel::Info,  __VA_ARGS__)
#define LOG_WARN(...)  ::skyline::log_msg(::skyline::LogLevel::Warn,  __VA_ARGS__)
#define LOG_ERROR(...) ::skyline::log_msg(::skyline::LogLevel::Error, __VA_ARGS__)
