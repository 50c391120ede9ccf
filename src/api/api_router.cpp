#include "api_router.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <store/database.hpp>
#include <fmt/format.h>
#include <util/string_utils.hpp>

using json = nlohmann::json;

std::string ApiRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? "" : it->second;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return 200;
        case ErrorKind::InvalidRequest:      return 400;
        case ErrorKind::AuthFailure:         return 401;
        case ErrorKind::JobNotFound:         return 404;
        case ErrorKind::NodeNotFound:        return 404;
        case ErrorKind::Conflict:            return 409;
        case ErrorKind::InvalidDryRunToken:  return 412;
        case ErrorKind::IdempotencyConflict: return 422;
        case ErrorKind::QueueFull:           return 429;
        case ErrorKind::AgentRejected:       return 502;
        case ErrorKind::AgentJobNotFound:    return 502;
        case ErrorKind::AgentUnreachable:    return 503;
        case ErrorKind::StorageFailure:      return 500;
    }
    return 500;
}

ApiResponse error_response(ErrorKind kind, const std::string& message) {
    ApiResponse r;
    r.status = http_status_for(kind);
    r.body = {{"error", {{"code", error_kind_name(kind)}, {"message", message}}}};
    return r;
}

namespace {

ApiResponse no_route(const ApiRequest& req) {
    ApiResponse r;
    r.status = 404;
    r.body = {{"error", {{"code", "NOT_FOUND"},
                         {"message", fmt::format("no route for {} {}", req.method, req.path)}}}};
    return r;
}

ApiResponse ok(json body, int status = 200) {
    ApiResponse r;
    r.status = status;
    r.body = std::move(body);
    return r;
}

template <typename T>
ApiResponse fail(const Result<T>& r) {
    return error_response(r.kind, r.error);
}

// Parse a JSON object body; InvalidRequest on anything else.
Result<json> parse_body(const std::string& body) {
    if (body.empty()) return Result<json>::Err(ErrorKind::InvalidRequest, "request body is required");
    try {
        auto j = json::parse(body);
        if (!j.is_object()) {
            return Result<json>::Err(ErrorKind::InvalidRequest, "request body must be a JSON object");
        }
        return Result<json>::Ok(j);
    } catch (const json::parse_error& e) {
        return Result<json>::Err(ErrorKind::InvalidRequest, fmt::format("malformed JSON: {}", e.what()));
    }
}

Result<std::string> required_string(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        return Result<std::string>::Err(ErrorKind::InvalidRequest,
                                        fmt::format("'{}' must be a non-empty string", key));
    }
    return Result<std::string>::Ok(j[key].get<std::string>());
}

json node_to_json(const NodeSummary& n) {
    json j = {
        {"id", n.config.id},
        {"name", n.config.name.empty() ? n.config.id : n.config.name},
        {"address", n.config.address},
        {"port", n.config.port},
        {"reachable", n.status.reachable},
        {"lastSeen", n.status.last_seen > 0 ? json(n.status.last_seen) : json(nullptr)},
        {"ok", n.status.reachable},
        {"running", n.running},
        {"queued", n.queued},
        {"maxConcurrent", n.config.max_concurrent},
        {"maxQueueDepth", n.config.max_queue_depth},
    };
    if (n.status.reachable) j["stats"] = n.status.last_stats;
    if (!n.status.last_error.empty()) j["error"] = n.status.last_error;
    return j;
}

} // namespace

ApiRouter::ApiRouter(HubService& hub) : hub_(hub) {}

// ── Entry point ─────────────────────────────────────────────

ApiResponse ApiRouter::handle(const ApiRequest& req) {
    try {
        ApiResponse resp = route(req);
        if (resp.status >= 500) {
            log_warn("api: {} {} -> {}", req.method, req.path, resp.status);
        } else {
            log_debug("api: {} {} -> {}", req.method, req.path, resp.status);
        }
        return resp;
    } catch (const StorageError& e) {
        hub_.record_storage_failure();
        log_error("api: {} {}: storage failure: {}", req.method, req.path, e.what());
        return error_response(ErrorKind::StorageFailure, "durable store failure");
    } catch (const std::exception& e) {
        log_error("api: {} {}: {}", req.method, req.path, e.what());
        return error_response(ErrorKind::StorageFailure, fmt::format("internal error: {}", e.what()));
    }
}

ApiResponse ApiRouter::route(const ApiRequest& req) {
    std::vector<std::string> parts;
    for (const auto& p : StringUtils::split(req.path, '/')) {
        if (!p.empty()) parts.push_back(p);
    }

    if (parts.empty()) {
        if (req.method == "GET") return get_root();
        return error_response(ErrorKind::InvalidRequest, "method not allowed");
    }
    if (parts[0] != "v1") return no_route(req);

    const std::string& key = hub_.config().api_key();
    if (!key.empty() && req.header("x-api-key") != key) {
        return error_response(ErrorKind::AuthFailure, "missing or invalid X-API-Key");
    }

    if (req.method == "POST" && req.header("idempotency-key").empty()) {
        return error_response(ErrorKind::InvalidRequest, "Idempotency-Key header is required");
    }

    const std::string& m = req.method;
    std::size_t n = parts.size();

    if (n == 2 && parts[1] == "health" && m == "GET") return get_health();
    if (n == 2 && parts[1] == "nodes" && m == "GET") return get_nodes();
    if (n == 2 && parts[1] == "remotes" && m == "GET") return get_remotes(req);
    if (n == 2 && parts[1] == "stream" && m == "GET") return get_stream();
    if (n == 2 && parts[1] == "jobs" && m == "GET") return get_jobs(req);

    if (n == 3 && parts[1] == "jobs") {
        if (m == "POST" && parts[2] == "plan") return post_plan(req);
        if (m == "POST") return post_job(req, parts[2]);
        if (m == "GET") return get_job(parts[2]);
    }
    if (n == 4 && parts[1] == "jobs") {
        if (m == "GET" && parts[3] == "checkpoints") return get_checkpoints(parts[2]);
        if (m == "POST" && parts[3] == "stop") return post_stop(parts[2]);
    }

    return no_route(req);
}

// ── Handlers ────────────────────────────────────────────────

ApiResponse ApiRouter::get_root() {
    return ok({{"message", "rchub orchestration hub"}, {"version", RCHUB_VERSION}});
}

ApiResponse ApiRouter::get_health() {
    HubCounters c = hub_.counters();
    json nodes = json::array();
    for (const auto& n : hub_.list_nodes()) {
        nodes.push_back({{"id", n.config.id}, {"reachable", n.status.reachable}});
    }
    return ok({
        {"status", "ok"},
        {"version", RCHUB_VERSION},
        {"nodes", nodes},
        {"counters", {
            {"dispatchFailures", c.dispatch_failures},
            {"checkpointFailures", c.checkpoint_failures},
            {"droppedEvents", c.dropped_events},
            {"storageFailures", c.storage_failures},
            {"subscribers", c.subscribers},
            {"monitoredJobs", c.monitored_jobs},
        }},
    });
}

ApiResponse ApiRouter::get_nodes() {
    json out = json::array();
    for (const auto& n : hub_.list_nodes()) out.push_back(node_to_json(n));
    return ok(out);
}

ApiResponse ApiRouter::get_remotes(const ApiRequest& req) {
    auto it = req.query.find("node");
    if (it == req.query.end() || it->second.empty()) {
        return error_response(ErrorKind::InvalidRequest, "query parameter 'node' is required");
    }
    auto remotes = hub_.list_remotes(it->second);
    if (remotes.is_err()) return fail(remotes);

    json list = json::array();
    for (const auto& b : remotes.value) list.push_back({{"name", b.name}});
    return ok({{"node", it->second}, {"remotes", list}});
}

ApiResponse ApiRouter::post_plan(const ApiRequest& req) {
    auto body = parse_body(req.body);
    if (body.is_err()) return fail(body);
    const json& j = body.value;

    auto node = required_string(j, "node");
    if (node.is_err()) return fail(node);
    auto kind_name = required_string(j, "kind");
    if (kind_name.is_err()) return fail(kind_name);
    auto kind = parse_job_kind(kind_name.value);
    if (!kind) {
        return error_response(ErrorKind::InvalidRequest,
                              fmt::format("unknown kind '{}'", kind_name.value));
    }
    auto src = required_string(j, "src");
    if (src.is_err()) return fail(src);
    auto dst = required_string(j, "dst");
    if (dst.is_err()) return fail(dst);
    auto flags = TransferFlags::from_json(j.contains("flags") ? j["flags"] : json(), *kind);
    if (flags.is_err()) return fail(flags);

    PlanRequest plan_req{node.value, *kind, src.value, dst.value, flags.value};
    auto plan = hub_.plan_job(plan_req);
    if (plan.is_err()) return fail(plan);
    return ok(plan_to_json(plan.value), 201);
}

ApiResponse ApiRouter::post_job(const ApiRequest& req, const std::string& kind_name) {
    auto kind = parse_job_kind(kind_name);
    if (!kind) {
        return error_response(ErrorKind::InvalidRequest, fmt::format("unknown kind '{}'", kind_name));
    }
    auto body = parse_body(req.body);
    if (body.is_err()) return fail(body);
    const json& j = body.value;

    auto node = required_string(j, "node");
    if (node.is_err()) return fail(node);
    auto src = required_string(j, "src");
    if (src.is_err()) return fail(src);
    auto dst = required_string(j, "dst");
    if (dst.is_err()) return fail(dst);
    auto flags = TransferFlags::from_json(j.contains("flags") ? j["flags"] : json(), *kind);
    if (flags.is_err()) return fail(flags);

    CreateJobRequest create;
    create.idempotency_key = req.header("idempotency-key");
    create.kind = *kind;
    create.node = node.value;
    create.src = src.value;
    create.dst = dst.value;
    create.flags = flags.value;
    if (j.contains("dryRunToken") && !j["dryRunToken"].is_null()) {
        if (!j["dryRunToken"].is_string()) {
            return error_response(ErrorKind::InvalidRequest, "'dryRunToken' must be a string");
        }
        create.dry_run_token = j["dryRunToken"].get<std::string>();
    }

    auto created = hub_.create_job(create);
    if (created.is_err()) return fail(created);

    const Job& job = created.value.job;
    return ok({{"jobId", job.uid}, {"status", to_string(job.status)}, {"created", created.value.created}},
              created.value.created ? 201 : 200);
}

ApiResponse ApiRouter::get_jobs(const ApiRequest& req) {
    JobFilter filter;
    auto it = req.query.find("status");
    if (it != req.query.end() && !it->second.empty()) {
        filter.status = parse_job_status(it->second);
        if (!filter.status) {
            return error_response(ErrorKind::InvalidRequest,
                                  fmt::format("unknown status '{}'", it->second));
        }
    }
    it = req.query.find("node");
    if (it != req.query.end() && !it->second.empty()) filter.node = it->second;
    it = req.query.find("limit");
    if (it != req.query.end() && !it->second.empty()) {
        int limit = safe_stoi(it->second, -1);
        if (limit < 1) {
            return error_response(ErrorKind::InvalidRequest, "'limit' must be a positive integer");
        }
        filter.limit = limit;
    }

    json out = json::array();
    for (const auto& job : hub_.list_jobs(filter)) out.push_back(job_to_json(job));
    return ok(out);
}

ApiResponse ApiRouter::get_job(const std::string& uid) {
    auto job = hub_.get_job(uid);
    if (job.is_err()) return fail(job);
    return ok(job_to_json(job.value));
}

ApiResponse ApiRouter::get_checkpoints(const std::string& uid) {
    auto history = hub_.checkpoints(uid);
    if (history.is_err()) return fail(history);
    json list = json::array();
    for (const auto& c : history.value) list.push_back(checkpoint_to_json(c));
    return ok({{"jobId", uid}, {"checkpoints", list}});
}

ApiResponse ApiRouter::post_stop(const std::string& uid) {
    auto stopped = hub_.stop_job(uid);
    if (stopped.is_err()) return fail(stopped);
    json body = {{"accepted", stopped.value.accepted}, {"job", job_to_json(stopped.value.job)}};
    if (!stopped.value.reason.empty()) body["reason"] = stopped.value.reason;
    return ok(body);
}

ApiResponse ApiRouter::get_stream() {
    ApiResponse r;
    r.status = 200;
    r.stream = hub_.subscribe();
    return r;
}
