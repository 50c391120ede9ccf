#pragma once

#include <string>
#include <fmt/format.h>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Parse "debug" / "info" / "warn" / "error". Unknown names map to Info.
LogLevel parse_log_level(const std::string& name);

// Configure sinks. An empty log_path leaves only the stderr mirror (warn and
// above). An empty job_log_dir disables per-job audit logs.
void init_log(const std::string& log_path, const std::string& job_log_dir, LogLevel level);

// Append a timestamped line to the hub log.
void hub_log(LogLevel level, const std::string& msg);

// Append a timestamped line to a job's persistent audit log: {job_log_dir}/{uid}.log
void append_job_log(const std::string& uid, const std::string& msg);

template <typename... Args>
inline void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    hub_log(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
inline void log_info(fmt::format_string<Args...> f, Args&&... args) {
    hub_log(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
inline void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    hub_log(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
inline void log_error(fmt::format_string<Args...> f, Args&&... args) {
    hub_log(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
}
