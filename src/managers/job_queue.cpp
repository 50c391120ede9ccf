#include "job_queue.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

std::size_t select_next(const std::deque<QueueEntry>& entries, int64_t now, int64_t promote_after) {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (e.plan_consumed || now - e.enqueued_at >= promote_after) return i;
    }
    return 0;
}

// ── Construction / Destruction ──────────────────────────────

JobQueue::JobQueue(JobStore& store, NodeRegistry& nodes, const TimingConfig& timings, NowFn now)
    : store_(store), nodes_(nodes), timings_(timings), now_(std::move(now)) {
    for (const auto& n : nodes_.nodes()) {
        auto q = std::make_unique<NodeQueue>();
        q->node = n.id;
        q->max_concurrent = std::max(1, n.max_concurrent);
        q->max_queue_depth = std::max(1, n.max_queue_depth);
        queues_[n.id] = std::move(q);
    }
}

JobQueue::~JobQueue() {
    stop();
}

JobQueue::NodeQueue* JobQueue::find(const std::string& node) const {
    auto it = queues_.find(node);
    return it == queues_.end() ? nullptr : it->second.get();
}

// ── Lifecycle ───────────────────────────────────────────────

void JobQueue::start() {
    if (started_) return;
    started_ = true;
    for (auto& [id, q] : queues_) {
        {
            std::lock_guard<std::mutex> lock(q->mutex);
            q->stopping = false;
        }
        NodeQueue* raw = q.get();
        q->worker = std::thread([this, raw] { worker_loop(*raw); });
    }
    log_info("queue: {} node workers started", queues_.size());
}

void JobQueue::stop() {
    if (!started_) return;
    for (auto& [id, q] : queues_) {
        {
            std::lock_guard<std::mutex> lock(q->mutex);
            q->stopping = true;
        }
        q->cv.notify_all();
    }
    for (auto& [id, q] : queues_) {
        if (q->worker.joinable()) q->worker.join();
    }
    started_ = false;
    log_info("queue: workers stopped");
}

void JobQueue::worker_loop(NodeQueue& q) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(q.mutex);
            auto wait = std::chrono::milliseconds(1000);
            auto now = std::chrono::steady_clock::now();
            if (q.retry_at > now) {
                wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(
                                          q.retry_at - now));
            }
            q.cv.wait_for(lock, wait, [&q] { return q.stopping || q.ready(); });
            if (q.stopping) break;
            if (!q.ready()) continue;
        }

        try {
            dispatch_next(q.node);
        } catch (const StorageError& e) {
            dispatch_failures_++;
            log_error("queue[{}]: storage failure during dispatch: {}", q.node, e.what());
            std::lock_guard<std::mutex> lock(q.mutex);
            q.retry_at = std::chrono::steady_clock::now() +
                         std::chrono::milliseconds(timings_.dispatch_backoff_ms);
        }
    }
}

// ── Admission ───────────────────────────────────────────────

Result<Job> JobQueue::admit(const std::string& uid, JobStatus from, const Gate& gate) {
    auto existing = store_.get(uid);
    if (!existing) {
        return Result<Job>::Err(ErrorKind::JobNotFound, fmt::format("job {} not found", uid));
    }
    NodeQueue* q = find(existing->node);
    if (!q) {
        return Result<Job>::Err(ErrorKind::NodeNotFound,
                                fmt::format("unknown node '{}'", existing->node));
    }

    std::lock_guard<std::mutex> lock(q->mutex);
    if (static_cast<int>(q->entries.size()) >= q->max_queue_depth) {
        log_warn("queue[{}]: rejecting {}, {} jobs already queued", q->node, uid, q->entries.size());
        return Result<Job>::Err(ErrorKind::QueueFull,
                                fmt::format("node '{}' queue is full ({} jobs)", q->node,
                                            q->entries.size()));
    }

    Job admitted;
    {
        Transaction tx(store_.db());
        Job candidate = *existing;
        if (gate) {
            auto g = gate(candidate);
            if (g.is_err()) return Result<Job>::Forward(g);
        }
        auto queued = store_.transition(uid, {from}, JobStatus::Queued, [&candidate](Job& j) {
            j.dry_run_token = candidate.dry_run_token;
        });
        if (queued.is_err()) return queued;
        tx.commit();
        admitted = queued.value;
    }

    QueueEntry entry;
    entry.uid = uid;
    entry.enqueued_at = now_();
    entry.plan_consumed = !admitted.dry_run_token.empty();
    q->entries.push_back(entry);
    q->cv.notify_all();

    log_info("queue[{}]: admitted {} ({} queued, {}/{} running)", q->node, uid,
             q->entries.size(), q->active.size(), q->max_concurrent);
    return Result<Job>::Ok(admitted);
}

// ── Dispatch ────────────────────────────────────────────────

int JobQueue::backoff_ms(int attempts) const {
    int64_t ms = timings_.dispatch_backoff_ms;
    for (int i = 1; i < attempts && ms < DISPATCH_BACKOFF_CAP_MS; ++i) ms *= 2;
    return static_cast<int>(std::min<int64_t>(ms, DISPATCH_BACKOFF_CAP_MS));
}

JobQueue::DispatchOutcome JobQueue::dispatch_next(const std::string& node) {
    NodeQueue* q = find(node);
    if (!q) return DispatchOutcome::Idle;

    // Reserve a slot before any I/O so concurrent dispatchers can never
    // exceed max_concurrent.
    QueueEntry entry;
    {
        std::lock_guard<std::mutex> lock(q->mutex);
        if (q->entries.empty() || static_cast<int>(q->active.size()) >= q->max_concurrent) {
            return DispatchOutcome::Idle;
        }
        std::size_t idx = select_next(q->entries, now_(), timings_.promote_after_secs);
        entry = q->entries[idx];
        q->entries.erase(q->entries.begin() + static_cast<std::ptrdiff_t>(idx));
        q->active.insert(entry.uid);
    }

    // Set once the agent accepted the job and cleared once running is stored.
    std::optional<int64_t> started_id;
    std::shared_ptr<AgentClient> agent;
    Job running;
    try {
        auto job = store_.get(entry.uid);
        if (!job || job->status != JobStatus::Queued) {
            release(node, entry.uid);
            return DispatchOutcome::Skipped;
        }

        auto client = nodes_.client(node);
        if (client.is_err()) {
            fail_job(*q, entry.uid, client.error);
            return DispatchOutcome::Failed;
        }
        agent = client.value;

        auto started = agent->start_operation(job->kind, job->src, job->dst, job->flags, false);
        if (started.is_err()) {
            dispatch_failures_++;
            entry.attempts++;
            auto counted = store_.update(entry.uid,
                                         [&entry](Job& j) { j.dispatch_attempts = entry.attempts; });
            if (counted.is_err()) log_warn("queue[{}]: {}", node, counted.error);
            append_job_log(entry.uid, fmt::format("dispatch attempt {} failed: {}", entry.attempts,
                                                  started.error));

            if (!is_retryable(started.kind)) {
                log_error("queue[{}]: dispatch of {} rejected: {}", node, entry.uid, started.error);
                fail_job(*q, entry.uid, started.error);
                return DispatchOutcome::Failed;
            }
            if (entry.attempts >= timings_.dispatch_max_attempts) {
                log_error("queue[{}]: giving up on {} after {} attempts: {}", node, entry.uid,
                          entry.attempts, started.error);
                fail_job(*q, entry.uid, fmt::format("{}: {}", REASON_AGENT_UNREACHABLE, started.error));
                return DispatchOutcome::Failed;
            }

            int delay = backoff_ms(entry.attempts);
            log_warn("queue[{}]: dispatch of {} failed (attempt {}/{}), retrying in {}ms: {}", node,
                     entry.uid, entry.attempts, timings_.dispatch_max_attempts, delay, started.error);
            requeue(*q, entry, delay);
            return DispatchOutcome::Retry;
        }

        int64_t agent_job_id = started.value;
        started_id = agent_job_id;
        int attempts = entry.attempts + 1;
        auto moved = store_.transition(entry.uid, {JobStatus::Queued}, JobStatus::Running,
                                       [agent_job_id, attempts](Job& j) {
                                           j.agent_job_id = agent_job_id;
                                           j.dispatch_attempts = attempts;
                                       });
        if (moved.is_err()) {
            // Stopped while the start call was in flight.
            log_warn("queue[{}]: {} changed during dispatch ({}), stopping agent job {}", node,
                     entry.uid, moved.error, agent_job_id);
            auto stopped = agent->stop_operation(agent_job_id);
            if (stopped.is_err()) {
                log_error("queue[{}]: could not stop orphaned agent job {}: {}", node, agent_job_id,
                          stopped.error);
            }
            release(node, entry.uid);
            return DispatchOutcome::Skipped;
        }
        started_id.reset();
        running = moved.value;
    } catch (const StorageError& e) {
        dispatch_failures_++;
        log_error("queue[{}]: storage failure dispatching {}: {}", node, entry.uid, e.what());
        if (started_id && agent) {
            auto stopped = agent->stop_operation(*started_id);
            if (stopped.is_err()) {
                log_error("queue[{}]: could not stop unrecorded agent job {}: {}", node, *started_id,
                          stopped.error);
            }
        }
        requeue(*q, entry, timings_.dispatch_backoff_ms);
        return DispatchOutcome::Retry;
    }

    log_info("queue[{}]: {} running as agent job {}", node, entry.uid,
             running.agent_job_id.value_or(-1));
    if (on_dispatched_) on_dispatched_(running);
    return DispatchOutcome::Dispatched;
}

void JobQueue::requeue(NodeQueue& q, const QueueEntry& entry, int delay_ms) {
    {
        std::lock_guard<std::mutex> lock(q.mutex);
        q.active.erase(entry.uid);
        q.entries.push_front(entry);
        q.retry_at = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    }
    q.cv.notify_all();
}

void JobQueue::fail_job(NodeQueue& q, const std::string& uid, const std::string& reason) {
    auto failed = store_.transition(uid, {JobStatus::Queued}, JobStatus::Failed,
                                    [&reason](Job& j) { j.error = reason; });
    release(q.node, uid);
    if (failed.is_ok() && on_terminal_) on_terminal_(failed.value);
}

// ── Slots ───────────────────────────────────────────────────

void JobQueue::release(const std::string& node, const std::string& uid) {
    NodeQueue* q = find(node);
    if (!q) return;
    {
        std::lock_guard<std::mutex> lock(q->mutex);
        if (q->active.erase(uid) == 0) return;
    }
    q->cv.notify_all();
}

bool JobQueue::remove(const std::string& node, const std::string& uid) {
    NodeQueue* q = find(node);
    if (!q) return false;
    std::lock_guard<std::mutex> lock(q->mutex);
    auto it = std::find_if(q->entries.begin(), q->entries.end(),
                           [&uid](const QueueEntry& e) { return e.uid == uid; });
    if (it == q->entries.end()) return false;
    q->entries.erase(it);
    return true;
}

void JobQueue::restore_running(const std::string& node, const std::string& uid) {
    NodeQueue* q = find(node);
    if (!q) return;
    std::lock_guard<std::mutex> lock(q->mutex);
    q->active.insert(uid);
}

void JobQueue::readmit(const Job& job) {
    NodeQueue* q = find(job.node);
    if (!q) return;
    {
        std::lock_guard<std::mutex> lock(q->mutex);
        QueueEntry entry;
        entry.uid = job.uid;
        entry.enqueued_at = job.created_at;
        entry.plan_consumed = !job.dry_run_token.empty();
        entry.attempts = job.dispatch_attempts;
        q->entries.push_back(entry);
    }
    q->cv.notify_all();
}

std::size_t JobQueue::running_count(const std::string& node) const {
    NodeQueue* q = find(node);
    if (!q) return 0;
    std::lock_guard<std::mutex> lock(q->mutex);
    return q->active.size();
}

std::size_t JobQueue::queued_count(const std::string& node) const {
    NodeQueue* q = find(node);
    if (!q) return 0;
    std::lock_guard<std::mutex> lock(q->mutex);
    return q->entries.size();
}
