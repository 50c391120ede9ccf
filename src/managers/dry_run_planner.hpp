#pragma once

#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <agent/node_registry.hpp>
#include <model/job.hpp>
#include <store/database.hpp>

// The tuple a plan is bound to. A token only admits a request whose tuple is
// identical, flags compared in canonical form.
struct PlanRequest {
    std::string node;
    JobKind kind = JobKind::Copy;
    std::string src;
    std::string dst;
    TransferFlags flags;

    bool operator==(const PlanRequest& o) const {
        return node == o.node && kind == o.kind && src == o.src && dst == o.dst && flags == o.flags;
    }
    bool operator!=(const PlanRequest& o) const { return !(*this == o); }
};

struct DryRunPlan {
    std::string token;
    PlanRequest request;
    std::vector<PlannedOperation> operations;
    int64_t created_at = 0;
    int64_t expires_at = 0;
};

// {token, node, kind, src, dst, flags, plannedOperations[], createdAt, expiresAt}
nlohmann::json plan_to_json(const DryRunPlan& plan);

class DryRunPlanner {
public:
    DryRunPlanner(Database& db, NodeRegistry& nodes, const TimingConfig& timings, NowFn now);

    // Run the operation on the agent with DryRun set, wait for it to finish,
    // capture what it would have done, and store the plan under a fresh token.
    Result<DryRunPlan> plan(const PlanRequest& req);

    // Consume a token for `consumer_uid`. Single use: the check and the
    // consumption are one transaction.
    //   InvalidDryRunToken  unknown, expired, already consumed, or bound to a
    //                       different request (a mismatch does not consume it)
    Result<DryRunPlan> validate(const std::string& token, const PlanRequest& binding,
                                const std::string& consumer_uid);

    // Drop plans past expiry. Returns the number removed.
    int purge_expired();

    // Abort in-flight waits (shutdown).
    void shutdown();

private:
    Result<std::vector<PlannedOperation>> wait_for_dry_run(AgentClient& client, int64_t agent_job_id);

    Database& db_;
    NodeRegistry& nodes_;
    TimingConfig timings_;
    NowFn now_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool stopping_ = false;
};
