#include "dry_run_planner.hpp"
#include <core/log.hpp>
#include <core/periodic_task.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>

using json = nlohmann::json;

json plan_to_json(const DryRunPlan& plan) {
    json ops = json::array();
    for (const auto& op : plan.operations) ops.push_back(planned_operation_to_json(op));
    return {
        {"token", plan.token},
        {"node", plan.request.node},
        {"kind", to_string(plan.request.kind)},
        {"src", plan.request.src},
        {"dst", plan.request.dst},
        {"flags", plan.request.flags.to_json()},
        {"plannedOperations", ops},
        {"createdAt", plan.created_at},
        {"expiresAt", plan.expires_at},
    };
}

DryRunPlanner::DryRunPlanner(Database& db, NodeRegistry& nodes, const TimingConfig& timings,
                             NowFn now)
    : db_(db), nodes_(nodes), timings_(timings), now_(std::move(now)) {}

void DryRunPlanner::shutdown() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stopping_ = true;
    }
    wait_cv_.notify_all();
}

// ── Planning ───────────────────────────────────────────────

Result<DryRunPlan> DryRunPlanner::plan(const PlanRequest& req) {
    auto client = nodes_.client(req.node);
    if (client.is_err()) return Result<DryRunPlan>::Forward(client);

    auto started = client.value->start_operation(req.kind, req.src, req.dst, req.flags, true);
    if (started.is_err()) {
        log_warn("plan: {} {} -> {} on {}: {}", to_string(req.kind), req.src, req.dst,
                 req.node, started.error);
        return Result<DryRunPlan>::Forward(started);
    }
    int64_t agent_job_id = started.value;
    log_info("plan: dry run {} {} -> {} on {} (agent job {})", to_string(req.kind), req.src,
             req.dst, req.node, agent_job_id);

    auto ops = wait_for_dry_run(*client.value, agent_job_id);
    if (ops.is_err()) return Result<DryRunPlan>::Forward(ops);

    DryRunPlan plan;
    plan.token = generate_token();
    plan.request = req;
    plan.operations = std::move(ops.value);
    plan.created_at = now_();
    plan.expires_at = plan.created_at + timings_.plan_ttl_secs;

    json ops_json = json::array();
    for (const auto& op : plan.operations) ops_json.push_back(planned_operation_to_json(op));

    Transaction tx(db_);
    {
        Statement st(db_, "INSERT INTO dry_run_plans (token, node, kind, src, dst, flags, "
                          "operations, created_at, expires_at) VALUES (?,?,?,?,?,?,?,?,?)");
        st.bind(1, plan.token).bind(2, req.node).bind(3, std::string(to_string(req.kind)))
          .bind(4, req.src).bind(5, req.dst).bind(6, req.flags.canonical())
          .bind(7, ops_json.dump()).bind(8, plan.created_at).bind(9, plan.expires_at);
        st.run();
    }
    tx.commit();

    log_info("plan: token {}... with {} operations, expires in {}s", plan.token.substr(0, 8),
             plan.operations.size(), timings_.plan_ttl_secs);
    return Result<DryRunPlan>::Ok(plan);
}

Result<std::vector<PlannedOperation>> DryRunPlanner::wait_for_dry_run(AgentClient& client,
                                                                      int64_t agent_job_id) {
    using Ops = std::vector<PlannedOperation>;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(timings_.plan_wait_timeout_secs);
    auto interval = std::chrono::milliseconds(timings_.plan_poll_interval_ms);

    while (true) {
        auto status = client.get_job_status(agent_job_id);
        if (status.is_err()) return Result<Ops>::Forward(status);

        if (status.value.finished) {
            if (!status.value.success && !status.value.error.empty()) {
                return Result<Ops>::Err(ErrorKind::AgentRejected,
                                        fmt::format("dry run failed: {}", status.value.error));
            }
            return client.list_operations(agent_job_id);
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            auto stopped = client.stop_operation(agent_job_id);
            if (stopped.is_err()) {
                log_warn("plan: could not stop timed-out dry run {}: {}", agent_job_id, stopped.error);
            }
            return Result<Ops>::Err(ErrorKind::AgentUnreachable,
                                    fmt::format("dry run did not finish within {}s",
                                                timings_.plan_wait_timeout_secs));
        }

        if (!wait_or_stop(wait_mutex_, wait_cv_, stopping_, interval)) {
            return Result<Ops>::Err(ErrorKind::AgentUnreachable, "hub is shutting down");
        }
    }
}

// ── Validation ─────────────────────────────────────────────

Result<DryRunPlan> DryRunPlanner::validate(const std::string& token, const PlanRequest& binding,
                                           const std::string& consumer_uid) {
    if (token.empty()) {
        return Result<DryRunPlan>::Err(ErrorKind::InvalidDryRunToken,
                                       fmt::format("{} requires a dry-run token",
                                                   to_string(binding.kind)));
    }

    int64_t now = now_();
    Transaction tx(db_);

    DryRunPlan plan;
    bool consumed = false;
    {
        Statement st(db_, "SELECT node, kind, src, dst, flags, operations, created_at, "
                          "expires_at, consumed_by FROM dry_run_plans WHERE token = ?");
        st.bind(1, token);
        if (!st.step()) {
            return Result<DryRunPlan>::Err(ErrorKind::InvalidDryRunToken, "unknown dry-run token");
        }
        plan.token = token;
        plan.request.node = st.text(0);
        plan.request.kind = parse_job_kind(st.text(1)).value_or(JobKind::Copy);
        plan.request.src = st.text(2);
        plan.request.dst = st.text(3);
        try {
            auto flags = TransferFlags::from_json(json::parse(st.text(4)), plan.request.kind);
            if (flags.is_ok()) plan.request.flags = flags.value;
            for (const auto& op : json::parse(st.text(5))) {
                plan.operations.push_back(planned_operation_from_json(op));
            }
        } catch (const json::exception& e) {
            return Result<DryRunPlan>::Err(ErrorKind::StorageFailure,
                                           fmt::format("stored plan is unreadable: {}", e.what()));
        }
        plan.created_at = st.int64(6);
        plan.expires_at = st.int64(7);
        consumed = !st.is_null(8);
    }

    if (consumed) {
        return Result<DryRunPlan>::Err(ErrorKind::InvalidDryRunToken,
                                       "dry-run token was already used");
    }
    if (plan.expires_at <= now) {
        return Result<DryRunPlan>::Err(ErrorKind::InvalidDryRunToken, "dry-run token has expired");
    }
    if (plan.request != binding) {
        return Result<DryRunPlan>::Err(ErrorKind::InvalidDryRunToken,
                                       "dry-run token was issued for a different request");
    }

    {
        Statement st(db_, "UPDATE dry_run_plans SET consumed_by = ?, consumed_at = ? WHERE token = ?");
        st.bind(1, consumer_uid).bind(2, now).bind(3, token);
        st.run();
    }
    tx.commit();
    return Result<DryRunPlan>::Ok(plan);
}

int DryRunPlanner::purge_expired() {
    Transaction tx(db_);
    int removed = 0;
    {
        Statement st(db_, "DELETE FROM dry_run_plans WHERE expires_at <= ?");
        st.bind(1, now_());
        st.run();
        removed = db_.changes();
    }
    tx.commit();
    if (removed > 0) log_debug("plan: purged {} expired plans", removed);
    return removed;
}
