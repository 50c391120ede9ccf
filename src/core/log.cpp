#include "log.hpp"
#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

struct LogState {
    std::mutex mutex;
    std::string path;
    std::string job_dir;
    LogLevel level = LogLevel::Info;
};

LogState& state() {
    static LogState s;
    return s;
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string clock_stamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[40];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "debug") return LogLevel::Debug;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void init_log(const std::string& log_path, const std::string& job_log_dir, LogLevel level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.path = log_path;
    s.job_dir = job_log_dir;
    s.level = level;

    std::error_code ec;
    if (!log_path.empty()) {
        auto parent = std::filesystem::path(log_path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }
    if (!job_log_dir.empty()) {
        std::filesystem::create_directories(job_log_dir, ec);
    }
}

void hub_log(LogLevel level, const std::string& msg) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level < s.level) return;

    std::string line = fmt::format("[{}] {:5} {}", clock_stamp(), level_tag(level), msg);

    if (!s.path.empty()) {
        std::ofstream out(s.path, std::ios::app);
        if (out) out << line << "\n";
    }
    if (level >= LogLevel::Warn) {
        std::cerr << line << "\n";
    }
}

void append_job_log(const std::string& uid, const std::string& msg) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.job_dir.empty()) return;

    auto path = std::filesystem::path(s.job_dir) / (uid + ".log");
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}
