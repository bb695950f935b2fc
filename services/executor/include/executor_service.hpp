#pragma once
#include "command_gate.hpp"
#include "config.hpp"
#include "job_registry.hpp"
#include "output_stream.hpp"
#include "retention_sweeper.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class CommandRejected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class JobNotFound : public std::runtime_error {
public:
    explicit JobNotFound(const std::string& id) : std::runtime_error("Job not found: " + id) {}
};

class ServiceStopping : public std::runtime_error {
public:
    ServiceStopping() : std::runtime_error("service is shutting down") {}
};

struct StatusView {
    std::string id;
    JobStatus status{JobStatus::Running};
    std::string command;
};

struct ResultView {
    std::string id;
    JobStatus status{JobStatus::Running};
    JobResult result;
};

struct CancelOutcome {
    bool cancelled{false};          // true if this call moved the job to cancelled
    JobStatus status{JobStatus::Running};
    std::string message;
};

struct HealthInfo {
    double uptime_seconds{0.0};
    std::size_t jobs_count{0};
};

// Entry point for every job operation. Owns the registry and the runner
// threads; destroying the service cancels running jobs and joins them.
class ExecutorService {
public:
    explicit ExecutorService(ServiceConfig config);
    ExecutorService(ServiceConfig config, CommandGate gate);
    ~ExecutorService();

    ExecutorService(const ExecutorService&) = delete;
    ExecutorService& operator=(const ExecutorService&) = delete;

    // Returns as soon as the job is registered and its runner launched.
    std::string submit(const JobRequest& req);
    StatusView get_status(const std::string& id) const;
    ResultView get_result(const std::string& id) const;
    CancelOutcome cancel(const std::string& id);
    std::vector<JobSummary> list();
    OutputSubscription subscribe(const std::string& id) const;
    HealthInfo health() const;

    std::size_t purge_expired() { return sweeper_.purge(); }
    void shutdown();

    const ServiceConfig& config() const { return config_; }
    JobRegistry& registry() { return registry_; }

private:
    struct Worker {
        std::string job_id;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    void launch(const std::string& id, const JobRequest& req);
    void join_finished_workers();

    ServiceConfig config_;
    CommandGate gate_;
    JobRegistry registry_;
    RetentionSweeper sweeper_;
    std::chrono::steady_clock::time_point started_;

    std::mutex workers_mtx_;
    std::vector<Worker> workers_;
    std::atomic<bool> stopping_{false};
};
