#include "job_monitor.hpp"
#include <core/log.hpp>
#include <store/database.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <vector>

int checkpoint_delay_ms(int interval_ms, int failures) {
    int64_t ms = interval_ms;
    for (int i = 0; i < failures && ms < CHECKPOINT_BACKOFF_CAP_MS; ++i) ms *= 2;
    return static_cast<int>(std::min<int64_t>(ms, std::max(interval_ms, CHECKPOINT_BACKOFF_CAP_MS)));
}

JobMonitor::JobMonitor(JobStore& store, CheckpointStore& checkpoints, NodeRegistry& nodes,
                       EventStreamer& events, const TimingConfig& timings)
    : store_(store), checkpoints_(checkpoints), nodes_(nodes), events_(events),
      timings_(timings) {}

JobMonitor::~JobMonitor() {
    stop_all();
}

// ── Watch set ───────────────────────────────────────────────

void JobMonitor::watch(const Job& job) {
    if (!job.agent_job_id) {
        log_error("monitor: {} is running without an agent job id", job.uid);
        return;
    }
    reap_finished();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& w = watches_[job.uid];
    if (w.task && !w.task->finished()) return;

    w.node = job.node;
    w.agent_job_id = *job.agent_job_id;
    w.consecutive_failures = 0;
    std::string uid = job.uid;
    w.task = std::make_unique<PeriodicTask>(
        fmt::format("monitor[{}]", uid),
        std::chrono::milliseconds(timings_.checkpoint_interval_ms),
        [this, uid] { return poll_once(uid); },
        false,
        [this, uid] { return next_poll_delay(uid); });
    log_debug("monitor: watching {} (agent job {} on {})", uid, w.agent_job_id, w.node);
}

void JobMonitor::unwatch(const std::string& uid) {
    std::unique_ptr<PeriodicTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watches_.find(uid);
        if (it == watches_.end()) return;
        task = std::move(it->second.task);
        watches_.erase(it);
    }
    // Joined outside the lock: the tick itself takes mutex_.
    if (task) task->cancel();
}

bool JobMonitor::watching(const std::string& uid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watches_.find(uid);
    return it != watches_.end() && it->second.task && !it->second.task->finished();
}

std::size_t JobMonitor::watched_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& [uid, w] : watches_) {
        if (w.task && !w.task->finished()) n++;
    }
    return n;
}

void JobMonitor::reap_finished() {
    std::vector<std::unique_ptr<PeriodicTask>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = watches_.begin(); it != watches_.end();) {
            if (it->second.task && it->second.task->finished()) {
                done.push_back(std::move(it->second.task));
                it = watches_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : done) t->cancel();
}

void JobMonitor::stop_all() {
    std::map<std::string, Watch> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(watches_);
    }
    for (auto& [uid, w] : all) {
        if (w.task) w.task->cancel();
    }
}

// ── Polling ─────────────────────────────────────────────────

bool JobMonitor::poll_once(const std::string& uid) {
    std::string node;
    int64_t agent_job_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watches_.find(uid);
        if (it != watches_.end()) {
            node = it->second.node;
            agent_job_id = it->second.agent_job_id;
        }
    }
    if (node.empty()) {
        auto job = store_.get(uid);
        if (!job || job->status != JobStatus::Running || !job->agent_job_id) return false;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& w = watches_[uid];
        w.node = node = job->node;
        w.agent_job_id = agent_job_id = *job->agent_job_id;
    }

    auto client = nodes_.client(node);
    if (client.is_err()) {
        finish(uid, JobStatus::Failed, client.error);
        return false;
    }

    try {
        auto status = client.value->get_job_status(agent_job_id);
        if (status.is_err()) {
            if (status.kind == ErrorKind::AgentJobNotFound) {
                log_warn("monitor: agent on {} no longer knows job {} ({})", node, agent_job_id, uid);
                finish(uid, JobStatus::Failed, REASON_LOST_ON_RESTART);
                return false;
            }
            return note_failure(uid, status.error);
        }

        auto stats = client.value->get_stats(agent_job_id);
        if (stats.is_err() && !status.value.finished) {
            return note_failure(uid, stats.error);
        }

        if (stats.is_ok()) {
            auto cp = checkpoints_.record(uid, stats.value);
            if (cp.is_err()) {
                // Left running underneath us (stopped through the API).
                log_debug("monitor: {} checkpoint skipped: {}", uid, cp.error);
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = watches_.find(uid);
                if (it != watches_.end()) it->second.consecutive_failures = 0;
            }
            Job snapshot;
            snapshot.uid = uid;
            snapshot.node = node;
            snapshot.status = JobStatus::Running;
            snapshot.bytes_transferred = cp.value.bytes_transferred;
            snapshot.files_transferred = cp.value.files_transferred;
            events_.publish_job_stats(snapshot, cp.value.speed, cp.value.errors);
        }

        if (status.value.finished) {
            if (status.value.success) {
                finish(uid, JobStatus::Completed, "");
            } else {
                finish(uid, JobStatus::Failed,
                       status.value.error.empty() ? "agent reported failure" : status.value.error);
            }
            return false;
        }
        return true;
    } catch (const StorageError& e) {
        return note_failure(uid, fmt::format("storage: {}", e.what()));
    }
}

bool JobMonitor::note_failure(const std::string& uid, const std::string& what) {
    checkpoint_failures_++;
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watches_.find(uid);
        if (it != watches_.end()) failures = ++it->second.consecutive_failures;
    }
    log_warn("monitor: checkpoint for {} failed ({}/{}): {}", uid, failures,
             timings_.checkpoint_max_failures, what);
    append_job_log(uid, fmt::format("checkpoint failed ({}): {}", failures, what));

    if (failures >= timings_.checkpoint_max_failures) {
        finish(uid, JobStatus::Failed,
               fmt::format("{}: {} consecutive checkpoint failures, last: {}",
                           REASON_AGENT_UNREACHABLE, failures, what));
        return false;
    }
    return true;
}

std::chrono::milliseconds JobMonitor::next_poll_delay(const std::string& uid) {
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watches_.find(uid);
        if (it != watches_.end()) failures = it->second.consecutive_failures;
    }
    return std::chrono::milliseconds(checkpoint_delay_ms(timings_.checkpoint_interval_ms, failures));
}

void JobMonitor::finish(const std::string& uid, JobStatus to, const std::string& error) {
    auto done = store_.transition(uid, {JobStatus::Running}, to, [&error](Job& j) {
        if (!error.empty()) j.error = error;
    });
    if (done.is_err()) {
        log_debug("monitor: {} not finished as {}: {}", uid, to_string(to), done.error);
        return;
    }
    log_info("monitor: {} {}{}", uid, to_string(to), error.empty() ? "" : " (" + error + ")");
    events_.publish_terminal(done.value);
    if (on_terminal_) on_terminal_(done.value);
}
