#pragma once

#include <string>
#include <fmt/format.h>
#include "types.hpp"

// Process-wide log sink. Lines go to the log file and, at or above the
// configured level, to stderr.
void log_init(const LogConfig& config);
std::string log_path();

bool log_enabled(LogLevel level);
void podtun_log(LogLevel level, const std::string& msg);

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& name, LogLevel& out);

inline void log_debug(const std::string& msg) { podtun_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { podtun_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { podtun_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { podtun_log(LogLevel::Error, msg); }
