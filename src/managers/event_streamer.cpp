#include "event_streamer.hpp"
#include <core/log.hpp>
#include <algorithm>

using json = nlohmann::json;

// ── Subscription ───────────────────────────────────────────

std::optional<Event> Subscription::next(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, wait, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    Event e = std::move(queue_.front());
    queue_.pop_front();
    return e;
}

bool Subscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool Subscription::push(const Event& e) {
    bool kept_all = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return true;
        if (limit_ > 0 && queue_.size() >= limit_) {
            queue_.pop_front();
            dropped_++;
            kept_all = false;
        }
        queue_.push_back(e);
    }
    cv_.notify_one();
    return kept_all;
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

// ── EventStreamer ──────────────────────────────────────────

EventStreamer::EventStreamer(SnapshotFn snapshot, std::size_t queue_limit, NowFn now)
    : snapshot_(std::move(snapshot)), queue_limit_(queue_limit), now_(std::move(now)) {}

EventStreamer::~EventStreamer() {
    close_all();
}

std::shared_ptr<Subscription> EventStreamer::subscribe() {
    auto sub = std::make_shared<Subscription>(queue_limit_);

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> jobs = snapshot_ ? snapshot_() : std::vector<Job>{};
    int64_t ts = now_();
    for (const auto& job : jobs) {
        Event e;
        e.ts = ts;
        e.job_id = job.uid;
        e.node_id = job.node;
        e.kind = Event::Kind::Stats;
        e.payload = job_to_json(job);
        e.payload["snapshot"] = true;
        sub->push(e);
    }
    subs_.push_back(sub);
    log_debug("stream: subscriber joined ({} active, {} snapshot events)", subs_.size(), jobs.size());
    return sub;
}

void EventStreamer::unsubscribe(const std::shared_ptr<Subscription>& sub) {
    if (!sub) return;
    sub->close();
    std::lock_guard<std::mutex> lock(mutex_);
    subs_.erase(std::remove(subs_.begin(), subs_.end(), sub), subs_.end());
    log_debug("stream: subscriber left ({} active)", subs_.size());
}

void EventStreamer::publish(const Event& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (e.job_id) {
        if (e.kind == Event::Kind::Stats && ended_.count(*e.job_id)) {
            log_debug("stream: dropping late stats for finished job {}", *e.job_id);
            return;
        }
        if (e.kind == Event::Kind::Terminal && ended_.insert(*e.job_id).second) {
            ended_order_.push_back(*e.job_id);
            if (ended_order_.size() > STREAM_ENDED_JOBS) {
                ended_.erase(ended_order_.front());
                ended_order_.pop_front();
            }
        }
    }
    for (const auto& sub : subs_) {
        if (!sub->push(e)) {
            uint64_t total = ++dropped_;
            // One line per power of two keeps a stuck reader from flooding the log.
            if ((total & (total - 1)) == 0) {
                log_warn("stream: slow subscriber, {} events dropped so far", total);
            }
        }
    }
}

void EventStreamer::publish_job_stats(const Job& job, double speed, int64_t errors) {
    Event e;
    e.ts = now_();
    e.job_id = job.uid;
    e.node_id = job.node;
    e.kind = Event::Kind::Stats;
    e.payload = {
        {"status", to_string(job.status)},
        {"bytesTransferred", job.bytes_transferred},
        {"filesTransferred", job.files_transferred},
        {"speed", speed},
        {"errors", errors},
    };
    publish(e);
}

void EventStreamer::publish_terminal(const Job& job) {
    Event e;
    e.ts = now_();
    e.job_id = job.uid;
    e.node_id = job.node;
    e.kind = Event::Kind::Terminal;
    e.payload = job_to_json(job);
    publish(e);
}

void EventStreamer::publish_node(const std::string& node_id, Event::Kind kind,
                                 const json& payload) {
    Event e;
    e.ts = now_();
    e.node_id = node_id;
    e.kind = kind;
    e.payload = payload;
    publish(e);
}

void EventStreamer::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sub : subs_) sub->close();
    subs_.clear();
}

std::size_t EventStreamer::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subs_.size();
}
