#pragma once

#include <string>
#include <fmt/format.h>

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
};

// Process-wide log sink. Lines go to stderr, and are also appended to
// log_file when one is configured. Never throws.
void ds_log_configure(const std::string& log_file, bool verbose);
void ds_log_write(LogLevel level, const std::string& msg);

inline void ds_log(const std::string& msg) { ds_log_write(LogLevel::Info, msg); }
inline void ds_warn(const std::string& msg) { ds_log_write(LogLevel::Warning, msg); }
inline void ds_error(const std::string& msg) { ds_log_write(LogLevel::Error, msg); }
inline void ds_debug(const std::string& msg) { ds_log_write(LogLevel::Debug, msg); }
