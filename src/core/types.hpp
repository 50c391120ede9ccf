#pragma once

#include <string>
#include <functional>
#include <cstdint>
#include <cstddef>
#include "constants.hpp"

// Error taxonomy shared by every layer. Kinds are stable: the API layer maps
// them to HTTP statuses and error codes.
enum class ErrorKind {
    None,
    AgentUnreachable,     // network failure or timeout talking to an agent (retryable)
    AuthFailure,          // bad credentials, hub or agent
    QueueFull,            // node queue at its configured depth
    InvalidDryRunToken,   // missing, expired, consumed or mismatched plan token
    IdempotencyConflict,  // key reused for a different request
    JobNotFound,
    NodeNotFound,
    InvalidRequest,
    AgentRejected,        // agent answered with an error of its own
    AgentJobNotFound,     // agent does not know the job id
    Conflict,             // job state changed underneath a transition
    StorageFailure,
};

const char* error_kind_name(ErrorKind kind);

// Retry policy lives with the caller; this only says whether a retry can help.
inline bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::AgentUnreachable;
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Re-type a failed result from another call.
    template <typename U>
    static Result<T> Forward(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Forward(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Injected wall clock, epoch seconds. Stores and planners take one so expiry
// can be driven from tests.
using NowFn = std::function<int64_t()>;

// Configuration structures
struct ListenConfig {
    std::string address = "0.0.0.0";
    int port = DEFAULT_LISTEN_PORT;
};

struct LoggingConfig {
    std::string path;               // hub log file, empty = stderr only
    std::string job_log_dir;        // per-job audit logs, empty = disabled
    std::string level = "info";
};

struct NodeConfig {
    std::string id;
    std::string name;
    std::string address;            // overlay address of the agent
    int port = 5572;
    std::string user;               // optional basic auth for the agent
    std::string password;
    int max_concurrent = DEFAULT_MAX_CONCURRENT;
    int max_queue_depth = DEFAULT_MAX_QUEUE_DEPTH;
};

struct TimingConfig {
    int rpc_timeout_ms = RPC_TIMEOUT_MS;
    int connect_timeout_ms = RPC_CONNECT_TIMEOUT_MS;
    int stop_timeout_ms = STOP_TIMEOUT_MS;
    int dispatch_max_attempts = DISPATCH_MAX_ATTEMPTS;
    int dispatch_backoff_ms = DISPATCH_BACKOFF_MS;
    int checkpoint_interval_ms = CHECKPOINT_INTERVAL_MS;
    int checkpoint_max_failures = CHECKPOINT_MAX_FAILURES;
    int node_poll_interval_ms = NODE_POLL_INTERVAL_MS;
    int64_t plan_ttl_secs = PLAN_TTL_SECS;
    int64_t plan_wait_timeout_secs = PLAN_WAIT_TIMEOUT_SECS;
    int plan_poll_interval_ms = PLAN_POLL_INTERVAL_MS;
    int64_t idempotency_retention_secs = IDEMPOTENCY_RETENTION_SECS;
    int64_t promote_after_secs = PROMOTE_AFTER_SECS;
    int64_t housekeeping_interval_secs = HOUSEKEEPING_INTERVAL_SECS;
    std::size_t stream_queue_limit = STREAM_QUEUE_LIMIT;
};

struct PolicyConfig {
    bool require_plan_for_copy = false;
};
