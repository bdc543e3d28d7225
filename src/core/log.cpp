#include "log.hpp"
#include <platform/platform.hpp>
#include <cli/theme.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

LogConfig& mutable_config() {
    static LogConfig config;
    return config;
}

std::string timestamp() {
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
    return ts;
}

} // namespace

void log_init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(log_mutex());
    mutable_config() = config;
}

std::string log_path() {
    const auto& configured = mutable_config().file_path;
    if (!configured.empty()) return configured;
    static std::string path = (platform::temp_dir() / "podtun.log").string();
    return path;
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(mutable_config().level);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug" || name == "trace") { out = LogLevel::Debug; return true; }
    if (name == "info")                     { out = LogLevel::Info;  return true; }
    if (name == "warn" || name == "warning") { out = LogLevel::Warn; return true; }
    if (name == "error")                    { out = LogLevel::Error; return true; }
    return false;
}

void podtun_log(LogLevel level, const std::string& msg) {
    if (!log_enabled(level)) return;

    std::lock_guard<std::mutex> lock(log_mutex());
    std::string line = fmt::format("[{}] {:<5} {}", timestamp(), log_level_name(level), msg);

    std::ofstream out(log_path(), std::ios::app);
    if (out) out << line << "\n";

    if (mutable_config().console) {
        if (level >= LogLevel::Warn)
            std::cerr << theme::log(theme::yellow(msg));
        else
            std::cerr << theme::log(msg);
    }
}
