#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <agent/node_registry.hpp>
#include <store/checkpoint_store.hpp>
#include <store/job_store.hpp>
#include "event_streamer.hpp"
#include "job_monitor.hpp"
#include "job_queue.hpp"

struct ReconcileReport {
    int reattached = 0;         // running jobs matched to live agent jobs
    int completed = 0;          // finished on the agent while the hub was away
    int failed = 0;             // failed on the agent, or lost
    int interrupted = 0;        // pending / dry-run-pending at start-up
    int requeued = 0;           // queued jobs put back in line
    int stop_confirmed = 0;     // unconfirmed stops settled
    int unreachable_nodes = 0;  // nodes whose jobs are monitored blind

    ReconcileReport& operator+=(const ReconcileReport& o);
};

nlohmann::json report_to_json(const ReconcileReport& r);

// Re-attaches durable job records to the work agents are actually doing.
// Runs once at start-up for every node and again for a node whenever its
// agent becomes reachable after an outage. A running job always ends up
// either monitored or terminal.
class Reconciler {
public:
    Reconciler(JobStore& store, CheckpointStore& checkpoints, NodeRegistry& nodes,
               JobQueue& queue, JobMonitor& monitor, EventStreamer& events);

    // Full start-up pass: interrupted admissions, every node, then the queue.
    ReconcileReport reconcile_startup();

    // Running and unconfirmed-stop jobs of one node.
    ReconcileReport reconcile_node(const std::string& node);

private:
    void settle(const Job& job, JobStatus to, const std::string& error, ReconcileReport& report);
    void reattach(const Job& job, ReconcileReport& report);

    JobStore& store_;
    CheckpointStore& checkpoints_;
    NodeRegistry& nodes_;
    JobQueue& queue_;
    JobMonitor& monitor_;
    EventStreamer& events_;
};
