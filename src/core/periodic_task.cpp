#include "periodic_task.hpp"
#include "log.hpp"

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick,
                           bool run_immediately, Delay next_delay)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick)),
      next_delay_(std::move(next_delay)) {
    thread_ = std::thread(&PeriodicTask::loop, this, run_immediately);
}

PeriodicTask::~PeriodicTask() {
    cancel();
    if (thread_.joinable()) {
        // Destroyed from its own tick: nothing left to wait for.
        thread_.detach();
    }
}

void PeriodicTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        canceled_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void PeriodicTask::loop(bool run_immediately) {
    bool first = true;
    while (true) {
        if (!first || !run_immediately) {
            auto delay = next_delay_ ? next_delay_() : interval_;
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, delay, [this] { return canceled_; });
            if (canceled_) break;
        } else {
            std::lock_guard<std::mutex> lock(mutex_);
            if (canceled_) break;
        }
        first = false;

        bool keep_going = false;
        try {
            keep_going = tick_();
        } catch (const std::exception& e) {
            log_error("{}: tick failed: {}", name_, e.what());
            keep_going = true;
        }
        if (!keep_going) break;
    }
    finished_.store(true);
}

bool wait_or_stop(std::mutex& mutex, std::condition_variable& cv,
                  const bool& stop, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, delay, [&stop] { return stop; });
    return !stop;
}
