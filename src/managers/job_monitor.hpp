#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <core/periodic_task.hpp>
#include <core/types.hpp>
#include <agent/node_registry.hpp>
#include <store/checkpoint_store.hpp>
#include <store/job_store.hpp>
#include "event_streamer.hpp"

// Wait before the next poll after `failures` consecutive failed ones: the
// interval, doubled per failure, capped at CHECKPOINT_BACKOFF_CAP_MS (or at the
// interval itself when that is longer).
int checkpoint_delay_ms(int interval_ms, int failures);

// One checkpoint-polling task per running job. Each tick asks the agent for
// the job's state; progress is persisted before it is published, and the task
// ends itself when the job leaves running.
class JobMonitor {
public:
    using JobCallback = std::function<void(const Job& job)>;

    JobMonitor(JobStore& store, CheckpointStore& checkpoints, NodeRegistry& nodes,
               EventStreamer& events, const TimingConfig& timings);
    ~JobMonitor();

    JobMonitor(const JobMonitor&) = delete;
    JobMonitor& operator=(const JobMonitor&) = delete;

    // Called after a job this monitor was watching reaches a terminal state.
    // Runs on the polling thread; must not call unwatch().
    void set_on_terminal(JobCallback cb) { on_terminal_ = std::move(cb); }

    // Start polling a running job. No-op if it is already watched.
    void watch(const Job& job);

    // Cancel polling (job stopped through the API). Waits for an in-flight tick.
    void unwatch(const std::string& uid);

    bool watching(const std::string& uid);
    std::size_t watched_count();

    // One poll. Returns false once the job is no longer running. Public so
    // tests can drive polling without the timer.
    bool poll_once(const std::string& uid);

    uint64_t checkpoint_failures() const { return checkpoint_failures_.load(); }

    void stop_all();

private:
    struct Watch {
        std::string node;
        int64_t agent_job_id = 0;
        int consecutive_failures = 0;
        std::unique_ptr<PeriodicTask> task;
    };

    // Returns false when the failure limit was reached and the job was failed.
    bool note_failure(const std::string& uid, const std::string& what);
    std::chrono::milliseconds next_poll_delay(const std::string& uid);
    void finish(const std::string& uid, JobStatus to, const std::string& error);
    void reap_finished();

    JobStore& store_;
    CheckpointStore& checkpoints_;
    NodeRegistry& nodes_;
    EventStreamer& events_;
    TimingConfig timings_;
    JobCallback on_terminal_;

    std::mutex mutex_;
    std::map<std::string, Watch> watches_;
    std::atomic<uint64_t> checkpoint_failures_{0};
};
