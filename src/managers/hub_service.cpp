#include "hub_service.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

// ── Construction / Destruction ──────────────────────────────

HubService::HubService(Config config, NodeRegistry::ClientFactory factory, NowFn now)
    : config_(std::move(config)), now_(now ? std::move(now) : NowFn(now_epoch)) {
    const TimingConfig& t = config_.timings();
    if (!factory) factory = make_rc_client_factory(t);

    db_ = std::make_unique<Database>(config_.db_path());
    jobs_ = std::make_unique<JobStore>(*db_, now_);
    checkpoints_ = std::make_unique<CheckpointStore>(*db_, now_);
    idempotency_ = std::make_unique<IdempotencyStore>(*db_, now_, t.idempotency_retention_secs);
    registry_ = std::make_unique<NodeRegistry>(config_.nodes(), factory);
    events_ = std::make_unique<EventStreamer>([this] { return jobs_->list_non_terminal(); },
                                              t.stream_queue_limit, now_);
    planner_ = std::make_unique<DryRunPlanner>(*db_, *registry_, t, now_);
    queue_ = std::make_unique<JobQueue>(*jobs_, *registry_, t, now_);
    monitor_ = std::make_unique<JobMonitor>(*jobs_, *checkpoints_, *registry_, *events_, t);
    reconciler_ = std::make_unique<Reconciler>(*jobs_, *checkpoints_, *registry_, *queue_,
                                               *monitor_, *events_);
    watcher_ = std::make_unique<NodeWatcher>(*registry_, *events_, t, now_);

    queue_->set_on_dispatched([this](const Job& job) {
        monitor_->watch(job);
        events_->publish_job_stats(job, 0.0, 0);
    });
    queue_->set_on_terminal([this](const Job& job) { events_->publish_terminal(job); });
    monitor_->set_on_terminal([this](const Job& job) { queue_->release(job.node, job.uid); });
    watcher_->set_on_recovered([this](const std::string& node) {
        log_info("hub: node {} reconnected, reconciling", node);
        reconciler_->reconcile_node(node);
    });
}

HubService::~HubService() {
    shutdown();
}

// ── Lifecycle ───────────────────────────────────────────────

ReconcileReport HubService::start(bool background) {
    ReconcileReport report = reconciler_->reconcile_startup();
    if (background) {
        queue_->start();
        watcher_->start();
        housekeeping_ = std::make_unique<PeriodicTask>(
            "housekeeping", std::chrono::seconds(config_.timings().housekeeping_interval_secs),
            [this] {
                housekeeping();
                return true;
            });
    }
    started_ = true;
    log_info("hub: started with {} nodes", registry_->nodes().size());
    return report;
}

void HubService::shutdown() {
    if (!started_) return;
    started_ = false;
    log_info("hub: shutting down");
    planner_->shutdown();
    if (housekeeping_) housekeeping_->cancel();
    housekeeping_.reset();
    watcher_->stop();
    queue_->stop();
    monitor_->stop_all();
    events_->close_all();
}

// ── Nodes ───────────────────────────────────────────────────

std::vector<NodeSummary> HubService::list_nodes() {
    std::vector<NodeSummary> out;
    for (const auto& n : registry_->nodes()) {
        NodeSummary s;
        s.config = n;
        s.status = registry_->status(n.id);
        s.running = queue_->running_count(n.id);
        s.queued = queue_->queued_count(n.id);
        out.push_back(std::move(s));
    }
    return out;
}

Result<std::vector<BackendDescriptor>> HubService::list_remotes(const std::string& node) {
    auto client = registry_->client(node);
    if (client.is_err()) return Result<std::vector<BackendDescriptor>>::Forward(client);
    return client.value->list_backends();
}

// ── Jobs ────────────────────────────────────────────────────

Result<DryRunPlan> HubService::plan_job(const PlanRequest& req) {
    if (!registry_->contains(req.node)) {
        return Result<DryRunPlan>::Err(ErrorKind::NodeNotFound,
                                       fmt::format("unknown node '{}'", req.node));
    }
    if (req.src.empty() || req.dst.empty()) {
        return Result<DryRunPlan>::Err(ErrorKind::InvalidRequest, "src and dst are required");
    }
    return planner_->plan(req);
}

Result<CreateJobResult> HubService::create_job(const CreateJobRequest& req) {
    using R = Result<CreateJobResult>;
    if (req.idempotency_key.empty()) {
        return R::Err(ErrorKind::InvalidRequest, "Idempotency-Key header is required");
    }
    if (!registry_->contains(req.node)) {
        return R::Err(ErrorKind::NodeNotFound, fmt::format("unknown node '{}'", req.node));
    }
    if (req.src.empty() || req.dst.empty()) {
        return R::Err(ErrorKind::InvalidRequest, "src and dst are required");
    }

    Job job;
    job.uid = generate_uuid();
    job.node = req.node;
    job.kind = req.kind;
    job.src = req.src;
    job.dst = req.dst;
    job.flags = req.flags;
    job.status = JobStatus::Pending;

    std::string fingerprint = request_fingerprint(to_string(req.kind), req.node, req.src, req.dst,
                                                  req.flags.canonical());
    auto reserved = idempotency_->reserve(req.idempotency_key, fingerprint, job.uid,
                                          [this, &job](const std::string&) { jobs_->insert(job); });
    if (reserved.is_err()) return R::Forward(reserved);

    if (!reserved.value.created) {
        auto existing = jobs_->get(reserved.value.job_uid);
        if (!existing) {
            return R::Err(ErrorKind::JobNotFound,
                          fmt::format("job {} for this key no longer exists", reserved.value.job_uid));
        }
        log_debug("hub: replayed key for {}", existing->uid);
        return R::Ok(CreateJobResult{*existing, false});
    }

    log_info("hub: created {} {} {} -> {} on {}", job.uid, to_string(job.kind), job.src, job.dst,
             job.node);

    bool needs_plan = is_destructive(req.kind) || config_.policy().require_plan_for_copy ||
                      !req.dry_run_token.empty();
    Result<Job> admitted = Result<Job>::Ok(job);
    if (needs_plan) {
        auto gated = jobs_->transition(job.uid, {JobStatus::Pending}, JobStatus::DryRunPending);
        if (gated.is_err()) return R::Forward(gated);

        PlanRequest binding{req.node, req.kind, req.src, req.dst, req.flags};
        std::string token = req.dry_run_token;
        admitted = queue_->admit(job.uid, JobStatus::DryRunPending,
                                 [this, &binding, &token](Job& j) -> Result<void> {
                                     auto plan = planner_->validate(token, binding, j.uid);
                                     if (plan.is_err()) return Result<void>::Forward(plan);
                                     j.dry_run_token = token;
                                     return Result<void>::Ok();
                                 });
    } else {
        admitted = queue_->admit(job.uid, JobStatus::Pending);
    }

    if (admitted.is_err()) {
        auto failed = fail_admission(job, req.idempotency_key, admitted);
        return R::Forward(failed);
    }
    return R::Ok(CreateJobResult{admitted.value, true});
}

Result<Job> HubService::fail_admission(const Job& job, const std::string& key,
                                       const Result<Job>& admitted) {
    std::string reason = admitted.error;
    if (admitted.kind == ErrorKind::InvalidDryRunToken) {
        reason = fmt::format("{}: {}", REASON_INVALID_TOKEN, admitted.error);
    } else if (admitted.kind == ErrorKind::QueueFull) {
        reason = REASON_QUEUE_FULL;
    }
    log_warn("hub: {} not admitted: {}", job.uid, admitted.error);

    auto failed = jobs_->transition(job.uid, {JobStatus::Pending, JobStatus::DryRunPending},
                                    JobStatus::Failed, [&reason](Job& j) { j.error = reason; });
    if (failed.is_ok()) events_->publish_terminal(failed.value);

    // The job stays as failed for audit; the key is freed so the client can
    // retry the same request once it has fixed the cause.
    idempotency_->release(key);
    return admitted;
}

Result<Job> HubService::get_job(const std::string& uid) {
    auto job = jobs_->get(uid);
    if (!job) return Result<Job>::Err(ErrorKind::JobNotFound, fmt::format("job {} not found", uid));
    return Result<Job>::Ok(*job);
}

std::vector<Job> HubService::list_jobs(const JobFilter& filter) {
    return jobs_->list(filter);
}

Result<std::vector<Checkpoint>> HubService::checkpoints(const std::string& uid) {
    if (!jobs_->get(uid)) {
        return Result<std::vector<Checkpoint>>::Err(ErrorKind::JobNotFound,
                                                    fmt::format("job {} not found", uid));
    }
    return Result<std::vector<Checkpoint>>::Ok(checkpoints_->history(uid));
}

Result<StopResult> HubService::stop_job(const std::string& uid) {
    using R = Result<StopResult>;

    // Two passes: a queued job may start running between the read and the
    // transition.
    for (int pass = 0; pass < 2; ++pass) {
        auto job = jobs_->get(uid);
        if (!job) return R::Err(ErrorKind::JobNotFound, fmt::format("job {} not found", uid));

        if (is_terminal(job->status)) {
            return R::Ok(StopResult{false, *job, fmt::format("job is already {}", to_string(job->status))});
        }

        if (job->status != JobStatus::Running) {
            queue_->remove(job->node, uid);
            auto stopped = jobs_->transition(
                uid, {JobStatus::Pending, JobStatus::DryRunPending, JobStatus::Queued},
                JobStatus::Stopped);
            if (stopped.is_err()) continue;
            log_info("hub: {} stopped before dispatch", uid);
            events_->publish_terminal(stopped.value);
            return R::Ok(StopResult{true, stopped.value, ""});
        }

        auto client = registry_->client(job->node);
        if (client.is_err()) return R::Forward(client);
        if (!job->agent_job_id) {
            return R::Err(ErrorKind::Conflict, fmt::format("job {} has no agent job id", uid));
        }

        auto agent_stop = client.value->stop_operation(*job->agent_job_id);
        std::string note;
        if (agent_stop.is_err()) {
            if (agent_stop.kind != ErrorKind::AgentUnreachable) {
                log_warn("hub: agent refused to stop {}: {}", uid, agent_stop.error);
                return R::Ok(StopResult{false, *job, agent_stop.error});
            }
            log_warn("hub: stop of {} unconfirmed: {}", uid, agent_stop.error);
            note = NOTE_STOP_UNCONFIRMED;
        }

        auto stopped = jobs_->transition(uid, {JobStatus::Running}, JobStatus::Stopped,
                                         [&note](Job& j) { j.note = note; });
        if (stopped.is_err()) {
            // Finished on its own while the stop was in flight.
            auto current = jobs_->get(uid);
            return R::Ok(StopResult{false, current ? *current : *job, stopped.error});
        }
        monitor_->unwatch(uid);
        queue_->release(job->node, uid);
        events_->publish_terminal(stopped.value);
        log_info("hub: {} stopped{}", uid, note.empty() ? "" : " (" + note + ")");
        return R::Ok(StopResult{true, stopped.value, ""});
    }
    auto job = jobs_->get(uid);
    return R::Err(ErrorKind::Conflict,
                  fmt::format("job {} changed state while stopping ({})", uid,
                              job ? to_string(job->status) : "missing"));
}

// ── Health / maintenance ────────────────────────────────────

HubCounters HubService::counters() {
    HubCounters c;
    c.dispatch_failures = queue_->dispatch_failures();
    c.checkpoint_failures = monitor_->checkpoint_failures();
    c.dropped_events = events_->dropped_total();
    c.storage_failures = storage_failures_.load();
    c.subscribers = events_->subscriber_count();
    c.monitored_jobs = monitor_->watched_count();
    return c;
}

int HubService::housekeeping() {
    try {
        int removed = idempotency_->purge_expired() + planner_->purge_expired();
        if (removed > 0) log_info("hub: housekeeping removed {} expired records", removed);
        return removed;
    } catch (const StorageError& e) {
        storage_failures_++;
        log_error("hub: housekeeping failed: {}", e.what());
        return 0;
    }
}
