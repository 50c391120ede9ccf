#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Runs tick() on its own thread every interval until tick() returns false or
// cancel() is called. The wait between ticks is the only suspension point and
// wakes immediately on cancellation. When `next_delay` is set it is asked for
// each wait instead of using the fixed interval.
class PeriodicTask {
public:
    using Tick = std::function<bool()>;
    using Delay = std::function<std::chrono::milliseconds()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick,
                 bool run_immediately = true, Delay next_delay = nullptr);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    // Signal cancellation and join. Safe to call from inside tick(): the
    // thread is then only signalled, not joined.
    void cancel();

    bool finished() const { return finished_.load(); }
    const std::string& name() const { return name_; }

private:
    void loop(bool run_immediately);

    std::string name_;
    std::chrono::milliseconds interval_;
    Tick tick_;
    Delay next_delay_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool canceled_ = false;
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

// Interruptible sleep shared by workers: returns false if `stop` became true.
bool wait_or_stop(std::mutex& mutex, std::condition_variable& cv,
                  const bool& stop, std::chrono::milliseconds delay);
