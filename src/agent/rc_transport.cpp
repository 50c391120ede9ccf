#include "rc_transport.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <mutex>

using json = nlohmann::json;

namespace {

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() { h = curl_easy_init(); }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
};

void global_init_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

} // namespace

Result<json> classify_rc_reply(long http_status, const std::string& body,
                               const std::string& method) {
    if (http_status == 200) {
        try {
            return Result<json>::Ok(body.empty() ? json::object() : json::parse(body));
        } catch (const json::parse_error& e) {
            return Result<json>::Err(ErrorKind::AgentRejected,
                                     fmt::format("{}: malformed reply: {}", method, e.what()));
        }
    }

    if (http_status == 401 || http_status == 403) {
        return Result<json>::Err(ErrorKind::AuthFailure,
                                 fmt::format("{}: agent refused credentials (HTTP {})",
                                             method, http_status));
    }

    // rclone replies {"error": "...", "input": {...}, "path": "...", "status": N}
    std::string message = body;
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("error") && j["error"].is_string()) {
            message = j["error"].get<std::string>();
        }
    } catch (const json::parse_error&) {
        // Not JSON: keep the raw text
    }

    if (to_lower(message).find("job not found") != std::string::npos) {
        return Result<json>::Err(ErrorKind::AgentJobNotFound,
                                 fmt::format("{}: {}", method, message));
    }
    return Result<json>::Err(ErrorKind::AgentRejected,
                             fmt::format("{}: HTTP {}: {}", method, http_status, message));
}

CurlRcTransport::CurlRcTransport(RcEndpoint endpoint) : endpoint_(std::move(endpoint)) {
    global_init_once();
    if (!endpoint_.base_url.empty() && endpoint_.base_url.back() == '/') {
        endpoint_.base_url.pop_back();
    }
}

Result<json> CurlRcTransport::call(const std::string& method, const json& body, int timeout_ms) {
    CurlHandle c;
    if (!c.h) {
        return Result<json>::Err(ErrorKind::AgentUnreachable, "curl_easy_init failed");
    }

    std::string url = endpoint_.base_url + "/" + method;
    std::string body_str = body.dump();
    std::string buf;

    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_str.size()));
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(endpoint_.connect_timeout_ms));
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    if (!endpoint_.user.empty()) {
        curl_easy_setopt(c.h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(c.h, CURLOPT_USERNAME, endpoint_.user.c_str());
        curl_easy_setopt(c.h, CURLOPT_PASSWORD, endpoint_.password.c_str());
    }

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        log_debug("rc: {} {} failed: {}", url, method, curl_easy_strerror(code));
        return Result<json>::Err(ErrorKind::AgentUnreachable,
                                 fmt::format("{}: {}", method, curl_easy_strerror(code)));
    }

    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    return classify_rc_reply(status, buf, method);
}
