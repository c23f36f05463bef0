#include "log.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdio>

namespace {

std::atomic<int> g_log_level{static_cast<int>(patchy::LogLevel::Warning)};

}  // namespace

void
patchy::log_set_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

patchy::LogLevel
patchy::log_get_level() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool
patchy::log_enabled(LogLevel level) {
    return static_cast<int>(level) <= g_log_level.load(std::memory_order_relaxed);
}

void
patchy::log_write(LogLevel level, const std::string& message) {
    fmt::print(stderr, "{}: {}\n", repr(level), message);
}

std::optional<patchy::LogLevel>
patchy::log_level_from_string(const std::string& s) {
    if (s == "error")
        return LogLevel::Error;
    else if (s == "warning" || s == "warn")
        return LogLevel::Warning;
    else if (s == "info")
        return LogLevel::Info;
    else if (s == "debug")
        return LogLevel::Debug;
    else if (s == "trace")
        return LogLevel::Trace;
    return std::nullopt;
}

std::string
patchy::repr(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "error";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Info:
            return "info";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Trace:
            return "trace";
    }
    return "unknown";
}
