#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/periodic_task.hpp>
#include <agent/node_registry.hpp>
#include <store/checkpoint_store.hpp>
#include <store/database.hpp>
#include <store/idempotency_store.hpp>
#include <store/job_store.hpp>
#include "dry_run_planner.hpp"
#include "event_streamer.hpp"
#include "job_monitor.hpp"
#include "job_queue.hpp"
#include "node_watcher.hpp"
#include "reconciler.hpp"

// Pure data structs for API consumption.

struct CreateJobRequest {
    std::string idempotency_key;
    JobKind kind = JobKind::Copy;
    std::string node;
    std::string src;
    std::string dst;
    TransferFlags flags;
    std::string dry_run_token;      // required for move / sync
};

struct CreateJobResult {
    Job job;
    bool created = false;           // false: replay of an earlier request with the same key
};

struct StopResult {
    bool accepted = false;
    Job job;
    std::string reason;             // why a stop was not accepted
};

struct NodeSummary {
    NodeConfig config;
    NodeStatus status;
    std::size_t running = 0;
    std::size_t queued = 0;
};

struct HubCounters {
    uint64_t dispatch_failures = 0;
    uint64_t checkpoint_failures = 0;
    uint64_t dropped_events = 0;
    uint64_t storage_failures = 0;
    std::size_t subscribers = 0;
    std::size_t monitored_jobs = 0;
};

// Headless hub facade: owns the store, registry, queue, monitors, planner,
// streamer and background tasks. The HTTP layer only talks to this.
class HubService {
public:
    // A null factory builds real rc clients; a null clock uses wall time.
    explicit HubService(Config config, NodeRegistry::ClientFactory factory = nullptr,
                        NowFn now = nullptr);
    ~HubService();

    HubService(const HubService&) = delete;
    HubService& operator=(const HubService&) = delete;

    // ── Lifecycle ─────────────────────────────────────────────

    // Reconcile durable state against the agents, then (when `background`)
    // start dispatch workers, node probes and housekeeping.
    ReconcileReport start(bool background = true);

    // Stop every worker. Running jobs keep running on their agents and are
    // picked up again by the next start().
    void shutdown();

    // ── Nodes ─────────────────────────────────────────────────

    std::vector<NodeSummary> list_nodes();
    Result<std::vector<BackendDescriptor>> list_remotes(const std::string& node);

    // ── Jobs ──────────────────────────────────────────────────

    Result<DryRunPlan> plan_job(const PlanRequest& req);

    // Idempotent: a retry with the same key returns the first job and never
    // dispatches twice.
    Result<CreateJobResult> create_job(const CreateJobRequest& req);

    Result<Job> get_job(const std::string& uid);
    std::vector<Job> list_jobs(const JobFilter& filter);
    Result<std::vector<Checkpoint>> checkpoints(const std::string& uid);

    // Queued jobs stop at once; running jobs stop once the agent confirms, or
    // after the stop timeout with the note "stop-unconfirmed".
    Result<StopResult> stop_job(const std::string& uid);

    // ── Stream ────────────────────────────────────────────────

    std::shared_ptr<Subscription> subscribe() { return events_->subscribe(); }
    void unsubscribe(const std::shared_ptr<Subscription>& sub) { events_->unsubscribe(sub); }

    // ── Health / maintenance ──────────────────────────────────

    HubCounters counters();
    void record_storage_failure() { storage_failures_++; }

    // Purge expired idempotency keys and plans. Returns records removed.
    int housekeeping();

    const Config& config() const { return config_; }

    // ── Direct accessors (tests) ──────────────────────────────

    JobQueue& queue() { return *queue_; }
    JobMonitor& monitor() { return *monitor_; }
    NodeRegistry& registry() { return *registry_; }
    JobStore& jobs() { return *jobs_; }
    DryRunPlanner& planner() { return *planner_; }
    Reconciler& reconciler() { return *reconciler_; }
    NodeWatcher& node_watcher() { return *watcher_; }

private:
    Result<Job> fail_admission(const Job& job, const std::string& key,
                               const Result<Job>& admitted);

    Config config_;
    NowFn now_;
    std::unique_ptr<Database> db_;
    std::unique_ptr<JobStore> jobs_;
    std::unique_ptr<CheckpointStore> checkpoints_;
    std::unique_ptr<IdempotencyStore> idempotency_;
    std::unique_ptr<NodeRegistry> registry_;
    std::unique_ptr<EventStreamer> events_;
    std::unique_ptr<DryRunPlanner> planner_;
    std::unique_ptr<JobQueue> queue_;
    std::unique_ptr<JobMonitor> monitor_;
    std::unique_ptr<Reconciler> reconciler_;
    std::unique_ptr<NodeWatcher> watcher_;
    std::unique_ptr<PeriodicTask> housekeeping_;

    std::atomic<uint64_t> storage_failures_{0};
    bool started_ = false;
};
