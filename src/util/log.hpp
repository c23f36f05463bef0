#pragma once

#include <fmt/format.h>

#include <optional>
#include <string>

namespace patchy {

enum class LogLevel {
    Error = 0,
    Warning,
    Info,
    Debug,
    Trace,
};

void
log_set_level(LogLevel level);

LogLevel
log_get_level();

bool
log_enabled(LogLevel level);

// Writes a single line to stderr, prefixed with the level name.
void
log_write(LogLevel level, const std::string& message);

std::optional<LogLevel>
log_level_from_string(const std::string& s);

std::string
repr(LogLevel level);

}  // namespace patchy

#define PATCHY_LOG(level, ...)                                         \
    do {                                                               \
        if (patchy::log_enabled(level)) {                              \
            patchy::log_write(level, fmt::format(__VA_ARGS__));        \
        }                                                              \
    } while (0)

#define LOG_ERROR(...) PATCHY_LOG(patchy::LogLevel::Error, __VA_ARGS__)
#define LOG_WARNING(...) PATCHY_LOG(patchy::LogLevel::Warning, __VA_ARGS__)
#define LOG_INFO(...) PATCHY_LOG(patchy::LogLevel::Info, __VA_ARGS__)
#define LOG_DEBUG(...) PATCHY_LOG(patchy::LogLevel::Debug, __VA_ARGS__)
#define LOG_TRACE(...) PATCHY_LOG(patchy::LogLevel::Trace, __VA_ARGS__)
