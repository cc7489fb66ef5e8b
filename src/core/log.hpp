#pragma once

#include <string>
#include <utility>
#include <fmt/format.h>

// Verbosity, most to least chatty. Read from PIPELINE_LOG at first use.
enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Off = 3 };

LogLevel parse_log_level(const std::string& s, LogLevel fallback = LogLevel::Info);
LogLevel log_level();
void set_log_level(LogLevel level);

inline bool log_enabled(LogLevel level) {
    return level != LogLevel::Off && level >= log_level();
}

// Tag shown in every line written by the calling thread ("watch", "intake-3", ...)
void set_log_thread_name(const std::string& name);

// Append one timestamped line to stderr. label is "debug", "info", "warn" or "error".
void log_write(const char* label, const std::string& msg);

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    if (log_enabled(LogLevel::Debug))
        log_write("debug", fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
    if (log_enabled(LogLevel::Info))
        log_write("info", fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    if (log_enabled(LogLevel::Warn))
        log_write("warn", fmt::format(f, std::forward<Args>(args)...));
}

// Errors share the warn threshold; only "off" silences them.
template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
    if (log_enabled(LogLevel::Warn))
        log_write("error", fmt::format(f, std::forward<Args>(args)...));
}
