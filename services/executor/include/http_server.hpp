#pragma once
#include "config.hpp"
#include "executor_service.hpp"

struct MHD_Daemon;

// libmicrohttpd front end. Runs one thread per connection so a live output
// stream can block on its own connection without stalling other requests.
class HttpServer {
public:
    HttpServer(ExecutorService& svc, ServiceConfig cfg);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    void stop();

    ExecutorService& service() { return svc_; }
    const ServiceConfig& config() const { return cfg_; }

private:
    ExecutorService& svc_;
    ServiceConfig cfg_;
    MHD_Daemon* daemon_{nullptr};
};
