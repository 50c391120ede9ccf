#pragma once

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>
#include <agent/agent_client.hpp>
#include <agent/rc_transport.hpp>

// In-process stand-in for a node's agent. Jobs start "running" and stay that
// way until finish() is called; dry runs finish immediately.
class FakeAgent : public AgentClient {
public:
    struct Start {
        JobKind kind;
        std::string src;
        std::string dst;
        bool dry_run;
    };

    Result<std::vector<BackendDescriptor>> list_backends() override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable) return Result<std::vector<BackendDescriptor>>::Err(ErrorKind::AgentUnreachable, "down");
        return Result<std::vector<BackendDescriptor>>::Ok({{"b2"}, {"gdrive"}, {"local"}});
    }

    Result<int64_t> start_operation(JobKind kind, const std::string& src, const std::string& dst,
                                    const TransferFlags&, bool dry_run) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable) return Result<int64_t>::Err(ErrorKind::AgentUnreachable, "connect timeout");
        if (fail_starts > 0) {
            fail_starts--;
            return Result<int64_t>::Err(start_error, "start refused");
        }
        int64_t id = next_id++;
        starts.push_back({kind, src, dst, dry_run});
        if (dry_run && !hold_dry_runs) {
            statuses[id] = AgentJobStatus{true, dry_run_error.empty(), dry_run_error};
        } else {
            active.insert(id);
            statuses[id] = AgentJobStatus{false, false, ""};
        }
        return Result<int64_t>::Ok(id);
    }

    Result<void> stop_operation(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable) return Result<void>::Err(ErrorKind::AgentUnreachable, "timeout");
        stops.push_back(id);
        if (!statuses.count(id)) return Result<void>::Err(ErrorKind::AgentJobNotFound, "job not found");
        active.erase(id);
        statuses[id] = AgentJobStatus{true, false, "context canceled"};
        return Result<void>::Ok();
    }

    Result<TransferStats> get_stats(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable) return Result<TransferStats>::Err(ErrorKind::AgentUnreachable, "timeout");
        return Result<TransferStats>::Ok(stats[id]);
    }

    Result<std::set<int64_t>> list_active_jobs() override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable) return Result<std::set<int64_t>>::Err(ErrorKind::AgentUnreachable, "timeout");
        return Result<std::set<int64_t>>::Ok(active);
    }

    Result<AgentJobStatus> get_job_status(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable) return Result<AgentJobStatus>::Err(ErrorKind::AgentUnreachable, "timeout");
        auto it = statuses.find(id);
        if (it == statuses.end()) {
            return Result<AgentJobStatus>::Err(ErrorKind::AgentJobNotFound, "job not found");
        }
        return Result<AgentJobStatus>::Ok(it->second);
    }

    Result<std::vector<PlannedOperation>> list_operations(int64_t) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable) {
            return Result<std::vector<PlannedOperation>>::Err(ErrorKind::AgentUnreachable, "timeout");
        }
        return Result<std::vector<PlannedOperation>>::Ok(plan_ops);
    }

    Result<nlohmann::json> node_stats() override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable) return Result<nlohmann::json>::Err(ErrorKind::AgentUnreachable, "timeout");
        return Result<nlohmann::json>::Ok({{"bytes", 0}, {"transfers", 0}});
    }

    // ── Test controls ───────────────────────────────────────

    void finish(int64_t id, bool success, const std::string& error = "") {
        std::lock_guard<std::mutex> lock(mutex);
        active.erase(id);
        statuses[id] = AgentJobStatus{true, success, error};
    }

    void set_progress(int64_t id, int64_t bytes, int64_t files) {
        std::lock_guard<std::mutex> lock(mutex);
        stats[id].bytes = bytes;
        stats[id].files = files;
    }

    // Agent restarted: forgets every job.
    void forget_all() {
        std::lock_guard<std::mutex> lock(mutex);
        active.clear();
        statuses.clear();
    }

    void set_unreachable(bool v) {
        std::lock_guard<std::mutex> lock(mutex);
        unreachable = v;
    }

    int real_starts() {
        std::lock_guard<std::mutex> lock(mutex);
        int n = 0;
        for (const auto& s : starts) n += s.dry_run ? 0 : 1;
        return n;
    }

    int64_t last_id() {
        std::lock_guard<std::mutex> lock(mutex);
        return next_id - 1;
    }

    std::mutex mutex;
    int64_t next_id = 100;
    bool unreachable = false;
    int fail_starts = 0;
    bool hold_dry_runs = false;         // dry runs stay unfinished
    std::string dry_run_error;          // dry runs finish with this error
    ErrorKind start_error = ErrorKind::AgentUnreachable;
    std::vector<Start> starts;
    std::vector<int64_t> stops;
    std::set<int64_t> active;
    std::map<int64_t, AgentJobStatus> statuses;
    std::map<int64_t, TransferStats> stats;
    std::vector<PlannedOperation> plan_ops = {
        {"copying", "photos/new.jpg", 2048, ""},
        {"deleting", "photos/old.jpg", 1024, ""},
    };
};

// Records rc calls and replays canned replies.
class FakeRcTransport : public RcTransport {
public:
    struct Call {
        std::string method;
        nlohmann::json body;
        int timeout_ms;
    };

    Result<nlohmann::json> call(const std::string& method, const nlohmann::json& body,
                                int timeout_ms) override {
        calls.push_back({method, body, timeout_ms});
        auto it = replies.find(method);
        if (it == replies.end()) return Result<nlohmann::json>::Ok(nlohmann::json::object());
        return it->second;
    }

    std::vector<Call> calls;
    std::map<std::string, Result<nlohmann::json>> replies;
};
