#include "reconciler.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ReconcileReport& ReconcileReport::operator+=(const ReconcileReport& o) {
    reattached += o.reattached;
    completed += o.completed;
    failed += o.failed;
    interrupted += o.interrupted;
    requeued += o.requeued;
    stop_confirmed += o.stop_confirmed;
    unreachable_nodes += o.unreachable_nodes;
    return *this;
}

nlohmann::json report_to_json(const ReconcileReport& r) {
    return {
        {"reattached", r.reattached},
        {"completed", r.completed},
        {"failed", r.failed},
        {"interrupted", r.interrupted},
        {"requeued", r.requeued},
        {"stopConfirmed", r.stop_confirmed},
        {"unreachableNodes", r.unreachable_nodes},
    };
}

Reconciler::Reconciler(JobStore& store, CheckpointStore& checkpoints, NodeRegistry& nodes,
                       JobQueue& queue, JobMonitor& monitor, EventStreamer& events)
    : store_(store), checkpoints_(checkpoints), nodes_(nodes), queue_(queue), monitor_(monitor),
      events_(events) {}

// ── Start-up ────────────────────────────────────────────────

ReconcileReport Reconciler::reconcile_startup() {
    ReconcileReport report;

    // Admission never completed for these; the client got no job id or is
    // still waiting on a connection that no longer exists.
    for (JobStatus s : {JobStatus::Pending, JobStatus::DryRunPending}) {
        for (const auto& job : store_.list_by_status(s)) {
            auto failed = store_.transition(job.uid, {s}, JobStatus::Failed,
                                            [](Job& j) { j.error = REASON_INTERRUPTED; });
            if (failed.is_ok()) {
                report.interrupted++;
                events_.publish_terminal(failed.value);
            }
        }
    }

    for (const auto& node : nodes_.nodes()) {
        report += reconcile_node(node.id);
    }

    for (const auto& job : store_.list_by_status(JobStatus::Queued)) {
        if (!nodes_.contains(job.node)) {
            settle(job, JobStatus::Failed, fmt::format("node '{}' is no longer configured", job.node),
                   report);
            continue;
        }
        queue_.readmit(job);
        report.requeued++;
    }

    // Running jobs on nodes removed from the configuration can never be polled.
    for (const auto& job : store_.list_by_status(JobStatus::Running)) {
        if (!nodes_.contains(job.node)) {
            settle(job, JobStatus::Failed, REASON_LOST_ON_RESTART, report);
        }
    }

    log_info("reconcile: start-up {}", report_to_json(report).dump());
    return report;
}

// ── Per node ────────────────────────────────────────────────

ReconcileReport Reconciler::reconcile_node(const std::string& node) {
    ReconcileReport report;
    auto client = nodes_.client(node);
    if (client.is_err()) return report;

    std::vector<Job> running;
    for (auto& job : store_.list_by_status(JobStatus::Running)) {
        if (job.node == node) running.push_back(std::move(job));
    }
    std::vector<Job> unconfirmed;
    for (auto& job : store_.list_by_status(JobStatus::Stopped)) {
        if (job.node == node && job.note == NOTE_STOP_UNCONFIRMED && job.agent_job_id) {
            unconfirmed.push_back(std::move(job));
        }
    }
    if (running.empty() && unconfirmed.empty()) return report;

    auto active = client.value->list_active_jobs();
    if (active.is_err()) {
        log_warn("reconcile[{}]: agent unavailable ({}), monitoring {} running jobs until it returns",
                 node, active.error, running.size());
        report.unreachable_nodes++;
        for (const auto& job : running) reattach(job, report);
        return report;
    }

    for (const auto& job : running) {
        if (monitor_.watching(job.uid)) continue;
        if (!job.agent_job_id) {
            settle(job, JobStatus::Failed, REASON_LOST_ON_RESTART, report);
            continue;
        }

        int64_t agent_job_id = *job.agent_job_id;
        if (active.value.count(agent_job_id)) {
            reattach(job, report);
            continue;
        }

        auto status = client.value->get_job_status(agent_job_id);
        if (status.is_err()) {
            if (status.kind == ErrorKind::AgentJobNotFound) {
                settle(job, JobStatus::Failed, REASON_LOST_ON_RESTART, report);
            } else {
                // Cannot tell yet: keep it monitored rather than guessing.
                reattach(job, report);
            }
            continue;
        }
        if (!status.value.finished) {
            reattach(job, report);
            continue;
        }

        auto stats = client.value->get_stats(agent_job_id);
        if (stats.is_ok()) {
            auto cp = checkpoints_.record(job.uid, stats.value);
            if (cp.is_err()) log_debug("reconcile[{}]: final checkpoint for {}: {}", node, job.uid, cp.error);
        }
        if (status.value.success) {
            settle(job, JobStatus::Completed, "", report);
        } else {
            settle(job, JobStatus::Failed,
                   status.value.error.empty() ? "agent reported failure" : status.value.error, report);
        }
    }

    for (const auto& job : unconfirmed) {
        int64_t agent_job_id = *job.agent_job_id;
        if (active.value.count(agent_job_id)) {
            auto stopped = client.value->stop_operation(agent_job_id);
            if (stopped.is_err()) {
                log_warn("reconcile[{}]: stop of agent job {} ({}) still unconfirmed: {}", node,
                         agent_job_id, job.uid, stopped.error);
                continue;
            }
            log_info("reconcile[{}]: re-issued stop for {} (agent job {})", node, job.uid,
                     agent_job_id);
        }
        auto noted = store_.update(job.uid, [](Job& j) { j.note = NOTE_STOP_CONFIRMED; });
        if (noted.is_ok()) {
            append_job_log(job.uid, "stop confirmed on restart");
            report.stop_confirmed++;
        }
    }

    log_info("reconcile[{}]: {}", node, report_to_json(report).dump());
    return report;
}

void Reconciler::reattach(const Job& job, ReconcileReport& report) {
    queue_.restore_running(job.node, job.uid);
    monitor_.watch(job);
    append_job_log(job.uid, "reattached to agent job after restart");
    report.reattached++;
}

void Reconciler::settle(const Job& job, JobStatus to, const std::string& error,
                        ReconcileReport& report) {
    auto done = store_.transition(job.uid, {job.status}, to, [&error](Job& j) {
        if (!error.empty()) j.error = error;
    });
    if (done.is_err()) {
        log_warn("reconcile: could not settle {}: {}", job.uid, done.error);
        return;
    }
    if (to == JobStatus::Completed) report.completed++; else report.failed++;
    queue_.release(job.node, job.uid);
    events_.publish_terminal(done.value);
}
