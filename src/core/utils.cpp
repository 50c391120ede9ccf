#include "utils.hpp"
#include "types.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <random>
#include <mutex>
#include <stdexcept>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static uint64_t random_u64() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};
    std::lock_guard<std::mutex> lock(rng_mutex);
    return rng();
}

std::string generate_uuid() {
    uint64_t hi = random_u64();
    uint64_t lo = random_u64();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  static_cast<unsigned long long>(hi >> 32),
                  static_cast<unsigned long long>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned long long>(hi & 0xFFFF),
                  static_cast<unsigned long long>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string generate_token() {
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(random_u64()),
                  static_cast<unsigned long long>(random_u64()));
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "NONE";
        case ErrorKind::AgentUnreachable:    return "AGENT_UNREACHABLE";
        case ErrorKind::AuthFailure:         return "AUTH_FAILURE";
        case ErrorKind::QueueFull:           return "QUEUE_FULL";
        case ErrorKind::InvalidDryRunToken:  return "INVALID_DRY_RUN_TOKEN";
        case ErrorKind::IdempotencyConflict: return "IDEMPOTENCY_CONFLICT";
        case ErrorKind::JobNotFound:         return "JOB_NOT_FOUND";
        case ErrorKind::NodeNotFound:        return "NODE_NOT_FOUND";
        case ErrorKind::InvalidRequest:      return "INVALID_REQUEST";
        case ErrorKind::AgentRejected:       return "AGENT_REJECTED";
        case ErrorKind::AgentJobNotFound:    return "AGENT_REJECTED";
        case ErrorKind::Conflict:            return "CONFLICT";
        case ErrorKind::StorageFailure:      return "STORAGE_FAILURE";
    }
    return "UNKNOWN";
}
