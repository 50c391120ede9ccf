#include "rc_client.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

using json = nlohmann::json;

// ── JSON helpers ───────────────────────────────────────────

json stats_to_json(const TransferStats& s) {
    json j = {
        {"bytes", s.bytes},
        {"files", s.files},
        {"speed", s.speed},
        {"errors", s.errors},
        {"totalBytes", s.total_bytes},
        {"checks", s.checks},
        {"deletes", s.deletes},
    };
    if (!s.last_error.empty()) j["lastError"] = s.last_error;
    return j;
}

json planned_operation_to_json(const PlannedOperation& op) {
    json j = {{"action", op.action}, {"path", op.path}, {"size", op.size}};
    if (!op.error.empty()) j["error"] = op.error;
    return j;
}

PlannedOperation planned_operation_from_json(const json& j) {
    PlannedOperation op;
    op.action = j.value("action", std::string());
    op.path = j.value("path", std::string());
    op.size = j.value("size", int64_t{0});
    op.error = j.value("error", std::string());
    return op;
}

static std::string group_for(int64_t agent_job_id) {
    return fmt::format("job/{}", agent_job_id);
}

// ── RcAgentClient ──────────────────────────────────────────

RcAgentClient::RcAgentClient(std::string node_id, std::unique_ptr<RcTransport> transport,
                             int rpc_timeout_ms, int stop_timeout_ms)
    : node_id_(std::move(node_id)), transport_(std::move(transport)),
      rpc_timeout_ms_(rpc_timeout_ms), stop_timeout_ms_(stop_timeout_ms) {}

Result<json> RcAgentClient::call(const std::string& method, const json& body) {
    auto r = transport_->call(method, body, rpc_timeout_ms_);
    if (r.is_err()) {
        log_debug("agent[{}]: {} -> {} ({})", node_id_, method, r.error, error_kind_name(r.kind));
    }
    return r;
}

const char* RcAgentClient::method_for(JobKind kind) {
    switch (kind) {
        case JobKind::Copy: return "sync/copy";
        case JobKind::Move: return "sync/move";
        case JobKind::Sync: return "sync/sync";
    }
    return "sync/copy";
}

json RcAgentClient::build_operation_payload(const std::string& src, const std::string& dst,
                                            const TransferFlags& flags, bool dry_run) {
    json payload = {{"srcFs", src}, {"dstFs", dst}, {"_async", true}};
    flags.apply_to_rc(payload);
    if (dry_run) {
        payload["_config"]["DryRun"] = true;
    }
    return payload;
}

Result<std::vector<BackendDescriptor>> RcAgentClient::list_backends() {
    auto r = call("config/listremotes", json::object());
    if (r.is_err()) return Result<std::vector<BackendDescriptor>>::Forward(r);

    std::vector<BackendDescriptor> out;
    const auto& remotes = r.value.contains("remotes") ? r.value["remotes"] : json::array();
    if (remotes.is_array()) {
        for (const auto& name : remotes) {
            if (name.is_string()) out.push_back({name.get<std::string>()});
        }
    }
    std::sort(out.begin(), out.end(),
              [](const BackendDescriptor& a, const BackendDescriptor& b) { return a.name < b.name; });
    return Result<std::vector<BackendDescriptor>>::Ok(out);
}

Result<int64_t> RcAgentClient::start_operation(JobKind kind, const std::string& src,
                                               const std::string& dst, const TransferFlags& flags,
                                               bool dry_run) {
    auto r = call(method_for(kind), build_operation_payload(src, dst, flags, dry_run));
    if (r.is_err()) return Result<int64_t>::Forward(r);

    if (!r.value.contains("jobid") || !r.value["jobid"].is_number_integer()) {
        return Result<int64_t>::Err(ErrorKind::AgentRejected,
                                    fmt::format("{}: reply has no jobid", method_for(kind)));
    }
    return Result<int64_t>::Ok(r.value["jobid"].get<int64_t>());
}

Result<void> RcAgentClient::stop_operation(int64_t agent_job_id) {
    auto r = transport_->call("job/stop", json{{"jobid", agent_job_id}}, stop_timeout_ms_);
    if (r.is_err()) {
        log_debug("agent[{}]: job/stop {} -> {}", node_id_, agent_job_id, r.error);
        return Result<void>::Forward(r);
    }
    return Result<void>::Ok();
}

Result<TransferStats> RcAgentClient::get_stats(int64_t agent_job_id) {
    auto r = call("core/stats", json{{"group", group_for(agent_job_id)}});
    if (r.is_err()) return Result<TransferStats>::Forward(r);

    const auto& j = r.value;
    TransferStats s;
    s.bytes = j.value("bytes", int64_t{0});
    s.files = j.value("transfers", int64_t{0});
    s.speed = j.value("speed", 0.0);
    s.errors = j.value("errors", int64_t{0});
    s.total_bytes = j.value("totalBytes", int64_t{0});
    s.checks = j.value("checks", int64_t{0});
    s.deletes = j.value("deletes", int64_t{0});
    s.last_error = j.value("lastError", std::string());
    return Result<TransferStats>::Ok(s);
}

Result<std::set<int64_t>> RcAgentClient::list_active_jobs() {
    auto r = call("job/list", json::object());
    if (r.is_err()) return Result<std::set<int64_t>>::Forward(r);

    // Newer agents split ids into runningIds/finishedIds; older ones only
    // report jobids, which then includes finished jobs still in memory.
    const char* key = r.value.contains("runningIds") ? "runningIds" : "jobids";
    std::set<int64_t> ids;
    if (r.value.contains(key) && r.value[key].is_array()) {
        for (const auto& id : r.value[key]) {
            if (id.is_number_integer()) ids.insert(id.get<int64_t>());
        }
    }
    return Result<std::set<int64_t>>::Ok(ids);
}

Result<AgentJobStatus> RcAgentClient::get_job_status(int64_t agent_job_id) {
    auto r = call("job/status", json{{"jobid", agent_job_id}});
    if (r.is_err()) return Result<AgentJobStatus>::Forward(r);

    AgentJobStatus s;
    s.finished = r.value.value("finished", false);
    s.success = r.value.value("success", false);
    s.error = r.value.value("error", std::string());
    return Result<AgentJobStatus>::Ok(s);
}

Result<std::vector<PlannedOperation>> RcAgentClient::list_operations(int64_t agent_job_id) {
    auto r = call("core/transferred", json{{"group", group_for(agent_job_id)}});
    if (r.is_err()) return Result<std::vector<PlannedOperation>>::Forward(r);

    std::vector<PlannedOperation> ops;
    if (r.value.contains("transferred") && r.value["transferred"].is_array()) {
        for (const auto& t : r.value["transferred"]) {
            PlannedOperation op;
            op.path = t.value("name", std::string());
            op.size = t.value("size", int64_t{0});
            op.error = t.value("error", std::string());
            if (t.contains("what") && t["what"].is_string()) {
                op.action = t["what"].get<std::string>();
            } else {
                op.action = t.value("checked", false) ? "checking" : "transferring";
            }
            ops.push_back(op);
        }
    }
    return Result<std::vector<PlannedOperation>>::Ok(ops);
}

Result<json> RcAgentClient::node_stats() {
    return call("core/stats", json::object());
}
