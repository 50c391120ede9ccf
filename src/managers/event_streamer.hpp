#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <model/event.hpp>
#include <model/job.hpp>

// One observer's bounded event queue. When the observer falls behind, the
// oldest queued event is dropped and counted.
class Subscription {
public:
    explicit Subscription(std::size_t limit) : limit_(limit) {}

    // Wait up to `wait` for the next event. nullopt on timeout or once closed
    // and drained.
    std::optional<Event> next(std::chrono::milliseconds wait);

    bool closed() const;
    uint64_t dropped() const { return dropped_.load(); }

private:
    friend class EventStreamer;
    // Returns false if an older event had to be dropped.
    bool push(const Event& e);
    void close();

    std::size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};
};

// Fans events out to every subscriber. A new subscriber first receives one
// snapshot event per non-terminal job, queued under the same lock that
// publish() takes, so no live event can precede the snapshots.
class EventStreamer {
public:
    using SnapshotFn = std::function<std::vector<Job>()>;

    EventStreamer(SnapshotFn snapshot, std::size_t queue_limit, NowFn now);
    ~EventStreamer();

    std::shared_ptr<Subscription> subscribe();
    void unsubscribe(const std::shared_ptr<Subscription>& sub);

    // A job stats event is dropped once that job's terminal event went out,
    // so a poll racing a stop cannot report progress after the end.
    void publish(const Event& e);

    // Convenience builders for the common job events.
    void publish_job_stats(const Job& job, double speed, int64_t errors);
    void publish_terminal(const Job& job);
    void publish_node(const std::string& node_id, Event::Kind kind, const nlohmann::json& payload);

    // Close every subscription (shutdown); blocked readers wake up.
    void close_all();

    std::size_t subscriber_count() const;
    uint64_t dropped_total() const { return dropped_.load(); }

private:
    SnapshotFn snapshot_;
    std::size_t queue_limit_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Subscription>> subs_;
    std::set<std::string> ended_;             // guarded by mutex_
    std::deque<std::string> ended_order_;     // oldest first, at most STREAM_ENDED_JOBS
    std::atomic<uint64_t> dropped_{0};
};
