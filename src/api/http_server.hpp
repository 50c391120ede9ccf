#pragma once

#include <string>
#include <core/types.hpp>
#include "api_router.hpp"

struct MHD_Daemon;

// libmicrohttpd front end for ApiRouter. Thread-per-connection, so a
// streaming client can block on its subscription without holding up others.
class HttpServer {
public:
    HttpServer(ApiRouter& router, HubService& hub, ListenConfig listen);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    Result<void> start();
    void stop();

    ApiRouter& router() { return router_; }
    HubService& hub() { return hub_; }

private:
    ApiRouter& router_;
    HubService& hub_;
    ListenConfig listen_;
    MHD_Daemon* daemon_{nullptr};
};
