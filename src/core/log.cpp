#include "log.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <algorithm>
#include <cctype>

namespace {

std::mutex& write_mutex() {
    static std::mutex m;
    return m;
}

thread_local std::string t_thread_name = "main";

LogLevel level_from_env() {
    const char* env = std::getenv("PIPELINE_LOG");
    if (!env) return LogLevel::Info;
    return parse_log_level(env, LogLevel::Info);
}

std::atomic<LogLevel>& current_level() {
    static std::atomic<LogLevel> level{level_from_env()};
    return level;
}

} // namespace

LogLevel parse_log_level(const std::string& s, LogLevel fallback) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug" || v == "trace") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning" || v == "error") return LogLevel::Warn;
    if (v == "off" || v == "none") return LogLevel::Off;
    return fallback;
}

LogLevel log_level() {
    return current_level().load();
}

void set_log_level(LogLevel level) {
    current_level().store(level);
}

void set_log_thread_name(const std::string& name) {
    t_thread_name = name;
}

void log_write(const char* label, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::string line = fmt::format("[{}] {:<5} [{}] {}\n", ts, label, t_thread_name, msg);
    std::lock_guard<std::mutex> lock(write_mutex());
    std::fputs(line.c_str(), stderr);
    std::fflush(stderr);
}
