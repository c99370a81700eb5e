// main.cpp
#include "requirements.hpp"
#include "SqliteBackend.hpp"
#include "ApiRouter.hpp"
#include "HttpServer.hpp"
#include "Logger.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>
#include <unistd.h>

void print_help() {
    std::cout << "Usage:\n"
              << "  ./scorekeeper               Run the score server (port from config, default 8000)\n"
              << "  ./scorekeeper <port>        Run on the given port\n"
              << "  ./scorekeeper -h, --help    Show this help message\n"
              << "\n"
              << "Environment:\n"
              << "  SCOREKEEPER_CONFIG          config file (default ./config.json)\n"
              << "  SCOREKEEPER_DB              sqlite database path (overrides config)\n";
}

int main(int argc, char** argv) {
    // Handle help flag early
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_help();
        return 0;
    }

    int port_override = 0;
    if (argc > 1) {
        char* end = nullptr;
        long p = std::strtol(argv[1], &end, 10);
        if (!end || *end != '\0' || p < 1 || p > 65535) {
            std::cerr << "[Main] invalid port: " << argv[1] << "\n";
            print_help();
            return 1;
        }
        port_override = static_cast<int>(p);
    }

    const char* cfg_env = std::getenv("SCOREKEEPER_CONFIG");
    const char* db_env  = std::getenv("SCOREKEEPER_DB");
    const std::string config_path = cfg_env ? cfg_env : "./config.json";

    auto boot = Requirements::run(config_path, db_env ? db_env : "", port_override);
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }

    SqliteBackend store(boot.db.get(), boot.config.windowSize());
    std::string err;
    if (!store.init(err)) {
        std::cerr << "[Main] aborted: " << err << "\n";
        return 1;
    }
    std::cout << "[Main] database ready: " << boot.config.getDbPath() << "\n";

    // [Signals] SIGINT/SIGTERM are taken by a sigwait thread; the logger
    // process inherits the mask and exits on pipe EOF instead.
    std::signal(SIGPIPE, SIG_IGN);
    sigset_t stop_sigs;
    sigemptyset(&stop_sigs);
    sigaddset(&stop_sigs, SIGINT);
    sigaddset(&stop_sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_sigs, nullptr);

    // [Create process for logging]
    pid_t logger_pid = -1;
    int log_fd = start_logger_process(boot.config.getLogPath(), logger_pid);
    if (log_fd < 0) {
        std::cerr << "[Main] operational log disabled\n";
    }

    ApiRouter router(store, boot.config, log_fd);
    HttpServer server(router, boot.config, log_fd);

    std::atomic<bool> stopping{false};
    std::thread sig_thr([&]() {
        int sig = 0;
        sigwait(&stop_sigs, &sig);
        stopping = true;
        std::cout << "\n[Main] signal " << sig << " received, stopping server...\n";
        server.stop();
    });

    std::cout << "\nQWERTY Command score server\n"
              << "   http://localhost:" << boot.config.getPort() << "\n"
              << "   Press Ctrl+C to stop\n\n";
    log_write(log_fd, "[Main] server starting on port " + std::to_string(boot.config.getPort()));

    const bool ok = server.listen();

    // wake the signal thread if listen returned on its own (bind failure)
    if (!stopping) kill(getpid(), SIGTERM);
    sig_thr.join();

    log_write(log_fd, "[Main] server stopped");
    stop_logger_process(log_fd, logger_pid);
    std::cout << "[Main] server stopped.\n";
    return ok ? 0 : 1;
}
