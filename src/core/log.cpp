#include "log.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
std::string g_log_file;
bool g_verbose = false;

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
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

void ds_log_configure(const std::string& log_file, bool verbose) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = log_file;
    g_verbose = verbose;
}

void ds_log_write(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level == LogLevel::Debug && !g_verbose) return;

    std::string line = fmt::format("[{}] {} {}\n", timestamp(), level_tag(level), msg);
    std::fputs(line.c_str(), stderr);

    if (g_log_file.empty()) return;
    std::ofstream out(g_log_file, std::ios::app);
    if (out) out << line;
}
