#pragma once

#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <managers/hub_service.hpp>

struct ApiRequest {
    std::string method;                             // "GET", "POST"
    std::string path;                               // "/v1/jobs/abc"
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;     // lower-case names
    std::string body;

    std::string header(const std::string& name) const;
};

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
    // Set for GET /v1/stream: the transport writes its events as NDJSON
    // instead of `body`, and unsubscribes when the client goes away.
    std::shared_ptr<Subscription> stream;
};

int http_status_for(ErrorKind kind);

// {"error": {"code": "...", "message": "..."}}
ApiResponse error_response(ErrorKind kind, const std::string& message);

// Transport-independent request dispatch for the inbound API.
class ApiRouter {
public:
    explicit ApiRouter(HubService& hub);

    // Never throws: storage and unexpected failures become 500 responses.
    ApiResponse handle(const ApiRequest& req);

private:
    ApiResponse route(const ApiRequest& req);

    ApiResponse get_root();
    ApiResponse get_health();
    ApiResponse get_nodes();
    ApiResponse get_remotes(const ApiRequest& req);
    ApiResponse post_plan(const ApiRequest& req);
    ApiResponse post_job(const ApiRequest& req, const std::string& kind);
    ApiResponse get_jobs(const ApiRequest& req);
    ApiResponse get_job(const std::string& uid);
    ApiResponse get_checkpoints(const std::string& uid);
    ApiResponse post_stop(const std::string& uid);
    ApiResponse get_stream();

    HubService& hub_;
};
