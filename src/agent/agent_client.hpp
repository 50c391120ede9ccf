#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <model/job.hpp>

struct BackendDescriptor {
    std::string name;
};

struct TransferStats {
    int64_t bytes = 0;
    int64_t files = 0;          // completed transfers
    double speed = 0.0;         // bytes/s
    int64_t errors = 0;
    int64_t total_bytes = 0;
    int64_t checks = 0;
    int64_t deletes = 0;
    std::string last_error;
};

struct AgentJobStatus {
    bool finished = false;
    bool success = false;
    std::string error;
};

// One would-be file operation captured from a dry run.
struct PlannedOperation {
    std::string action;         // "transferring", "deleting", "checking", ...
    std::string path;
    int64_t size = 0;
    std::string error;
};

nlohmann::json stats_to_json(const TransferStats& s);
nlohmann::json planned_operation_to_json(const PlannedOperation& op);
PlannedOperation planned_operation_from_json(const nlohmann::json& j);

// Typed proxy to one node's agent. Every call is bounded by a timeout and
// fails with AgentUnreachable on network trouble; none retries internally.
class AgentClient {
public:
    virtual ~AgentClient() = default;

    virtual Result<std::vector<BackendDescriptor>> list_backends() = 0;

    // Returns the agent-assigned job id of an asynchronously started operation.
    virtual Result<int64_t> start_operation(JobKind kind, const std::string& src,
                                            const std::string& dst, const TransferFlags& flags,
                                            bool dry_run) = 0;

    virtual Result<void> stop_operation(int64_t agent_job_id) = 0;
    virtual Result<TransferStats> get_stats(int64_t agent_job_id) = 0;
    virtual Result<std::set<int64_t>> list_active_jobs() = 0;

    // Terminal-status lookup. AgentJobNotFound when the agent has forgotten the job.
    virtual Result<AgentJobStatus> get_job_status(int64_t agent_job_id) = 0;

    // Files touched by a finished job; for a dry run, what would have been touched.
    virtual Result<std::vector<PlannedOperation>> list_operations(int64_t agent_job_id) = 0;

    // Node-wide stats; doubles as the reachability probe.
    virtual Result<nlohmann::json> node_stats() = 0;
};
