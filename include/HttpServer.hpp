#pragma once
#include "ApiRouter.hpp"
#include "ConfigManager.hpp"
#include <memory>
#include <string>

namespace httplib { class Server; }

// cpp-httplib front end: CORS headers, OPTIONS preflight, /api/ routing
// through ApiRouter, optional static files, request log.
class HttpServer {
public:
    HttpServer(ApiRouter& router, const ConfigManager& config, int log_fd);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // blocks until stop(); false if the socket could not be bound
    bool listen();

    // two-step start on a kernel-chosen port: returns the port, -1 on failure
    int  bindToAnyPort(const std::string& host);
    bool listenAfterBind();

    bool isRunning() const;
    void stop();

private:
    void registerRoutes();

    ApiRouter& router_;
    const ConfigManager& config_;
    int log_fd_;
    std::unique_ptr<httplib::Server> svr_;
};
