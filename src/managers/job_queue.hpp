#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <agent/node_registry.hpp>
#include <store/job_store.hpp>

struct QueueEntry {
    std::string uid;
    int64_t enqueued_at = 0;        // epoch secs
    bool plan_consumed = false;     // admitted with a dry-run token
    int attempts = 0;               // failed dispatch attempts so far
};

// Index of the entry to dispatch next: the oldest entry that carries a
// consumed plan or has waited at least `promote_after` seconds, otherwise the
// head. `entries` must not be empty.
std::size_t select_next(const std::deque<QueueEntry>& entries, int64_t now, int64_t promote_after);

// Per-node admission-controlled scheduler. Each node owns its own lock, queue,
// slot set and dispatch worker; nodes never block each other. The slot set is
// the only cross-worker shared counter and is touched only under the node lock.
class JobQueue {
public:
    // Runs inside the admission transaction, under the node lock. Used to
    // consume the dry-run token; an error aborts admission with no side effect.
    using Gate = std::function<Result<void>(Job& job)>;
    using JobCallback = std::function<void(const Job& job)>;

    enum class DispatchOutcome { Idle, Dispatched, Retry, Failed, Skipped };

    JobQueue(JobStore& store, NodeRegistry& nodes, const TimingConfig& timings, NowFn now);
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // Called when a job reaches running (start monitoring) and when the queue
    // itself ends a job in failed. Set before start().
    void set_on_dispatched(JobCallback cb) { on_dispatched_ = std::move(cb); }
    void set_on_terminal(JobCallback cb) { on_terminal_ = std::move(cb); }

    // Move `uid` from `from` to queued and enqueue it.
    //   QueueFull when the node already holds max_queue_depth queued jobs.
    Result<Job> admit(const std::string& uid, JobStatus from, const Gate& gate = nullptr);

    // Start one job on `node` if a slot and a queued job are available.
    // Workers call this; tests drive it directly.
    DispatchOutcome dispatch_next(const std::string& node);

    // Free the slot held by a job that left running. Idempotent.
    void release(const std::string& node, const std::string& uid);

    // Drop a queued entry (stop before dispatch). False if it was not queued.
    bool remove(const std::string& node, const std::string& uid);

    // Restart recovery: occupy a slot for a reattached running job, or put a
    // persisted queued job back in line without touching its stored state.
    void restore_running(const std::string& node, const std::string& uid);
    void readmit(const Job& job);

    std::size_t running_count(const std::string& node) const;
    std::size_t queued_count(const std::string& node) const;
    uint64_t dispatch_failures() const { return dispatch_failures_.load(); }

    void start();
    void stop();

private:
    struct NodeQueue {
        std::string node;
        int max_concurrent = 1;
        int max_queue_depth = 1;

        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<QueueEntry> entries;
        std::set<std::string> active;     // slots held: dispatching or running
        std::chrono::steady_clock::time_point retry_at{};
        bool stopping = false;
        std::thread worker;

        bool ready() const {
            return !entries.empty() && static_cast<int>(active.size()) < max_concurrent &&
                   std::chrono::steady_clock::now() >= retry_at;
        }
    };

    NodeQueue* find(const std::string& node) const;
    void worker_loop(NodeQueue& q);
    void fail_job(NodeQueue& q, const std::string& uid, const std::string& reason);
    // Give the slot back and put the entry at the head, not dispatchable for delay_ms.
    void requeue(NodeQueue& q, const QueueEntry& entry, int delay_ms);
    int backoff_ms(int attempts) const;

    JobStore& store_;
    NodeRegistry& nodes_;
    TimingConfig timings_;
    NowFn now_;
    JobCallback on_dispatched_;
    JobCallback on_terminal_;

    // Built once in the constructor; the map itself is never modified.
    std::map<std::string, std::unique_ptr<NodeQueue>> queues_;
    std::atomic<uint64_t> dispatch_failures_{0};
    bool started_ = false;
};
