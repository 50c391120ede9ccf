#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <core/types.hpp>

// One JSON-over-HTTP remote-control call: POST {base}/{method} with a JSON body.
class RcTransport {
public:
    virtual ~RcTransport() = default;
    virtual Result<nlohmann::json> call(const std::string& method, const nlohmann::json& body,
                                        int timeout_ms) = 0;
};

struct RcEndpoint {
    std::string base_url;       // http://100.64.0.10:5572
    std::string user;           // basic auth, empty = none
    std::string password;
    int connect_timeout_ms = 3000;
};

// libcurl transport, one easy handle per call so it is safe across threads.
//   transport failure / timeout -> AgentUnreachable
//   HTTP 401 / 403              -> AuthFailure
//   "job not found"             -> AgentJobNotFound
//   other non-200 / bad JSON    -> AgentRejected
class CurlRcTransport : public RcTransport {
public:
    explicit CurlRcTransport(RcEndpoint endpoint);

    Result<nlohmann::json> call(const std::string& method, const nlohmann::json& body,
                                int timeout_ms) override;

private:
    RcEndpoint endpoint_;
};

// Classify a non-200 agent reply. Exposed for tests.
Result<nlohmann::json> classify_rc_reply(long http_status, const std::string& body,
                                         const std::string& method);
