#include "http_server.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <microhttpd.h>
#include <chrono>
#include <cstring>

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

// State of one NDJSON stream response.
struct StreamCtx {
    HubService* hub;
    std::shared_ptr<Subscription> sub;
    std::string pending;
    std::size_t offset = 0;
};

MhdResult send_json(struct MHD_Connection* conn, int status, const std::string& body) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(
        body.size(), const_cast<char*>(body.data()), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "application/json");
    MhdResult ret = MHD_queue_response(conn, static_cast<unsigned int>(status), resp);
    MHD_destroy_response(resp);
    return ret;
}

std::map<std::string, std::string> collect(struct MHD_Connection* conn, enum MHD_ValueKind kind,
                                           bool lower_keys) {
    struct Sink {
        std::map<std::string, std::string> values;
        bool lower;
    } sink{{}, lower_keys};
    MHD_get_connection_values(
        conn, kind,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* s = static_cast<Sink*>(cls);
            std::string k = key ? key : "";
            if (s->lower) k = to_lower(k);
            s->values[k] = StringUtils::trim(val ? val : "");
            return MHD_YES;
        },
        &sink);
    return sink.values;
}

ssize_t stream_reader(void* cls, uint64_t /*pos*/, char* buf, size_t max) {
    auto* ctx = static_cast<StreamCtx*>(cls);

    if (ctx->offset >= ctx->pending.size()) {
        ctx->pending.clear();
        ctx->offset = 0;
        auto e = ctx->sub->next(std::chrono::milliseconds(STREAM_WAIT_MS));
        if (!e) {
            // Nothing yet; thread-per-connection mode calls back again.
            return ctx->sub->closed() ? MHD_CONTENT_READER_END_OF_STREAM : 0;
        }
        ctx->pending = event_to_line(*e);
    }

    std::size_t n = std::min(max, ctx->pending.size() - ctx->offset);
    std::memcpy(buf, ctx->pending.data() + ctx->offset, n);
    ctx->offset += n;
    return static_cast<ssize_t>(n);
}

void stream_free(void* cls) {
    auto* ctx = static_cast<StreamCtx*>(cls);
    ctx->hub->unsubscribe(ctx->sub);
    delete ctx;
}

MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url,
                  const char* method, const char* /*version*/, const char* upload_data,
                  size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<HttpServer*>(cls);
    auto* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    ApiRequest req;
    req.method = ci->method;
    req.path = ci->url;
    req.query = collect(connection, MHD_GET_ARGUMENT_KIND, false);
    req.headers = collect(connection, MHD_HEADER_KIND, true);
    req.body = std::move(ci->body);

    ApiResponse resp = server->router().handle(req);
    if (!resp.stream) return send_json(connection, resp.status, resp.body.dump());

    auto* ctx = new StreamCtx{&server->hub(), resp.stream, {}, 0};
    struct MHD_Response* r = MHD_create_response_from_callback(MHD_SIZE_UNKNOWN, 4096,
                                                               &stream_reader, ctx, &stream_free);
    if (!r) {
        stream_free(ctx);
        return MHD_NO;
    }
    MHD_add_response_header(r, MHD_HTTP_HEADER_CONTENT_TYPE, "application/x-ndjson");
    MHD_add_response_header(r, MHD_HTTP_HEADER_CACHE_CONTROL, "no-cache");
    MhdResult ret = MHD_queue_response(connection, MHD_HTTP_OK, r);
    MHD_destroy_response(r);
    return ret;
}

void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

} // namespace

HttpServer::HttpServer(ApiRouter& router, HubService& hub, ListenConfig listen)
    : router_(router), hub_(hub), listen_(std::move(listen)) {}

HttpServer::~HttpServer() {
    stop();
}

Result<void> HttpServer::start() {
    if (daemon_) return Result<void>::Ok();

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(listen_.port));
    if (listen_.address.empty()) {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, listen_.address.c_str(), &addr.sin_addr) != 1) {
        return Result<void>::Err(ErrorKind::InvalidRequest,
                                 fmt::format("listen.address '{}' is not an IPv4 address",
                                             listen_.address));
    }

    daemon_ = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD,
                               static_cast<uint16_t>(listen_.port), nullptr, nullptr,
                               &handler, this,
                               MHD_OPTION_SOCK_ADDR, reinterpret_cast<struct sockaddr*>(&addr),
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) {
        return Result<void>::Err(ErrorKind::InvalidRequest,
                                 fmt::format("cannot listen on {}:{}", listen_.address, listen_.port));
    }
    log_info("http: listening on {}:{}", listen_.address, listen_.port);
    return Result<void>::Ok();
}

void HttpServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
    log_info("http: stopped");
}
