#include "job.hpp"

using json = nlohmann::json;

const char* to_string(JobKind kind) {
    switch (kind) {
        case JobKind::Copy: return "copy";
        case JobKind::Move: return "move";
        case JobKind::Sync: return "sync";
    }
    return "copy";
}

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:       return "pending";
        case JobStatus::DryRunPending: return "dry-run-pending";
        case JobStatus::Queued:        return "queued";
        case JobStatus::Running:       return "running";
        case JobStatus::Completed:     return "completed";
        case JobStatus::Failed:        return "failed";
        case JobStatus::Stopped:       return "stopped";
    }
    return "pending";
}

std::optional<JobKind> parse_job_kind(const std::string& s) {
    if (s == "copy") return JobKind::Copy;
    if (s == "move") return JobKind::Move;
    if (s == "sync") return JobKind::Sync;
    return std::nullopt;
}

std::optional<JobStatus> parse_job_status(const std::string& s) {
    if (s == "pending") return JobStatus::Pending;
    if (s == "dry-run-pending") return JobStatus::DryRunPending;
    if (s == "queued") return JobStatus::Queued;
    if (s == "running") return JobStatus::Running;
    if (s == "completed") return JobStatus::Completed;
    if (s == "failed") return JobStatus::Failed;
    if (s == "stopped") return JobStatus::Stopped;
    return std::nullopt;
}

bool can_transition(JobStatus from, JobStatus to) {
    if (is_terminal(from)) return false;
    if (to == JobStatus::Failed || to == JobStatus::Stopped) return true;

    switch (from) {
        case JobStatus::Pending:
            return to == JobStatus::DryRunPending || to == JobStatus::Queued;
        case JobStatus::DryRunPending:
            return to == JobStatus::Queued;
        case JobStatus::Queued:
            return to == JobStatus::Running;
        case JobStatus::Running:
            return to == JobStatus::Completed;
        default:
            return false;
    }
}

json job_to_json(const Job& job) {
    json j = {
        {"jobId", job.uid},
        {"node", job.node},
        {"kind", to_string(job.kind)},
        {"src", job.src},
        {"dst", job.dst},
        {"flags", job.flags.to_json()},
        {"agentJobId", job.agent_job_id ? json(*job.agent_job_id) : json(nullptr)},
        {"status", to_string(job.status)},
        {"bytesTransferred", job.bytes_transferred},
        {"filesTransferred", job.files_transferred},
        {"createdAt", job.created_at},
        {"updatedAt", job.updated_at},
        {"dispatchAttempts", job.dispatch_attempts},
    };
    if (!job.error.empty()) j["error"] = job.error;
    if (!job.note.empty()) j["note"] = job.note;
    return j;
}
