// === src/HttpServer/HttpServer.cpp ===
#include "HttpServer.hpp"
#include "Logger.hpp"
#include <httplib.h>

#include <exception>
#include <iostream>

HttpServer::HttpServer(ApiRouter& router, const ConfigManager& config, int log_fd)
    : router_(router), config_(config), log_fd_(log_fd),
      svr_(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

HttpServer::~HttpServer() {
    stop();
}

// Desc: wire headers, handlers, static mount and logging onto the server
// In: (none)
// Out: void
void HttpServer::registerRoutes() {
    httplib::Server& svr = *svr_;

    svr.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"}
    });

    auto api = [this](const httplib::Request& req, httplib::Response& res) {
        ApiResponse out = router_.dispatch(req.method, req.path, req.params, req.body);
        res.status = out.status;
        res.set_content(out.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        "application/json");
    };
    svr.Get(R"(/api/.*)", api);
    svr.Post(R"(/api/.*)", api);

    // CORS preflight
    svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
    });

    svr.Post(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_content(R"({"error":"Method Not Allowed"})", "application/json");
    });

    const std::string& static_dir = config_.getStaticDir();
    if (!static_dir.empty()) {
        if (svr.set_mount_point("/", static_dir)) {
            std::cout << "[Server] serving static files from " << static_dir << "\n";
        } else {
            std::cerr << "[Server] cannot mount static dir: " << static_dir << "\n";
        }
    }

    svr.set_exception_handler([this](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        std::cerr << "[Server] " << req.method << " " << req.path << " failed: " << what << "\n";
        log_write(log_fd_, "[Server] " + req.method + " " + req.path + " failed: " + what);
        res.status = 500;
        res.set_content(R"({"error":"Internal server error"})", "application/json");
    });

    // Only API traffic is logged; static file requests stay quiet.
    svr.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        if (req.path.rfind("/api/", 0) != 0) return;
        const std::string line = "[API] " + req.method + " " + req.path + " - " + std::to_string(res.status);
        std::cout << line << "\n";
        log_write(log_fd_, line);
    });
}

bool HttpServer::listen() {
    std::cout << "[Server] listening on http://" << config_.getHost() << ":" << config_.getPort() << "\n";
    if (!svr_->listen(config_.getHost(), config_.getPort())) {
        std::cerr << "[Server] failed to bind " << config_.getHost() << ":" << config_.getPort() << "\n";
        return false;
    }
    return true;
}

int HttpServer::bindToAnyPort(const std::string& host) {
    const int port = svr_->bind_to_any_port(host);
    if (port < 0) {
        std::cerr << "[Server] failed to bind " << host << " on any port\n";
    }
    return port;
}

bool HttpServer::listenAfterBind() {
    return svr_->listen_after_bind();
}

bool HttpServer::isRunning() const {
    return svr_ && svr_->is_running();
}

void HttpServer::stop() {
    if (svr_ && svr_->is_running()) svr_->stop();
}
