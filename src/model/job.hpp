#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "transfer_flags.hpp"

enum class JobKind { Copy, Move, Sync };

// pending -> dry-run-pending -> queued -> running -> {completed | failed | stopped}
// Non-destructive kinds go pending -> queued. Any non-terminal state may end
// in failed or stopped.
enum class JobStatus { Pending, DryRunPending, Queued, Running, Completed, Failed, Stopped };

const char* to_string(JobKind kind);
const char* to_string(JobStatus status);
std::optional<JobKind> parse_job_kind(const std::string& s);
std::optional<JobStatus> parse_job_status(const std::string& s);

// Move and sync remove or overwrite data at the destination.
inline bool is_destructive(JobKind kind) {
    return kind == JobKind::Move || kind == JobKind::Sync;
}

inline bool is_terminal(JobStatus s) {
    return s == JobStatus::Completed || s == JobStatus::Failed || s == JobStatus::Stopped;
}

// Forward-only check against the state machine above.
bool can_transition(JobStatus from, JobStatus to);

struct Job {
    std::string uid;                      // hub-generated, distinct from the agent's id
    std::string node;
    JobKind kind = JobKind::Copy;
    std::string src;
    std::string dst;
    TransferFlags flags;
    std::optional<int64_t> agent_job_id;  // set at dispatch
    JobStatus status = JobStatus::Pending;
    int64_t bytes_transferred = 0;
    int64_t files_transferred = 0;
    int64_t created_at = 0;
    int64_t updated_at = 0;

    std::string error;                    // reason for failed (e.g. "lost-on-restart")
    std::string note;                     // e.g. "stop-unconfirmed"
    std::string dry_run_token;            // plan consumed at admission
    int dispatch_attempts = 0;
};

// API snapshot: {jobId, node, kind, src, dst, flags, agentJobId, status, ...}
nlohmann::json job_to_json(const Job& job);
