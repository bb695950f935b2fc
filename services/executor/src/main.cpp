#include "config.hpp"
#include "executor_service.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include <stdexcept>

int main(int argc, char** argv) {
    ServiceConfig cfg;
    try {
        cfg = load_config_from_env();
        if (!apply_cli_args(cfg, argc, argv)) {
            std::cout << config_usage();
            return 0;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "[executor] " << e.what() << "\n" << config_usage();
        return 2;
    }
    set_log_level(cfg.log_level);

    // Block termination signals before any thread exists so only sigwait()
    // below sees them. Runner children reset their mask after fork.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    if (int err = pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr)) {
        std::cerr << "[executor] pthread_sigmask: " << std::strerror(err) << std::endl;
        return 1;
    }
    std::signal(SIGPIPE, SIG_IGN);

    ExecutorService service(cfg);
    HttpServer server(service, cfg);
    log_info("starting HTTP server on port " + std::to_string(cfg.port) + ", base dir " + cfg.base_dir.string());
    if (!server.start()) {
        log_error("failed to start HTTP server on port " + std::to_string(cfg.port));
        return 1;
    }

    int sig = 0;
    if (int err = sigwait(&stop_signals, &sig)) {
        log_error(std::string("sigwait: ") + std::strerror(err));
    } else {
        log_info(std::string("received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");
    }
    // Cancelling jobs first lets open streams reach their done marker, so
    // stopping the daemon does not wait on them.
    service.shutdown();
    server.stop();
    return 0;
}
