#include "executor_service.hpp"
#include "log.hpp"
#include "process_runner.hpp"
#include <algorithm>
#include <system_error>

namespace {
// Upper bound on how long cancel() waits for the runner to kill and reap.
constexpr std::chrono::seconds kCancelGrace{5};
}

ExecutorService::ExecutorService(ServiceConfig config) : ExecutorService(std::move(config), CommandGate()) {}

ExecutorService::ExecutorService(ServiceConfig config, CommandGate gate)
    : config_(std::move(config)),
      gate_(std::move(gate)),
      sweeper_(registry_, config_.job_ttl),
      started_(std::chrono::steady_clock::now()) {}

ExecutorService::~ExecutorService() { shutdown(); }

std::string ExecutorService::submit(const JobRequest& req) {
    if (stopping_.load()) throw ServiceStopping();
    sweeper_.purge();
    join_finished_workers();

    if (auto reason = gate_.check(req.command)) {
        log_warn("rejected command: " + req.command);
        throw CommandRejected(*reason);
    }

    std::string id = registry_.create(req);
    log_info("job " + id + " submitted: " + req.command);
    launch(id, req);
    return id;
}

void ExecutorService::launch(const std::string& id, const JobRequest& req) {
    RunSettings settings;
    settings.command = req.command;
    settings.cwd = req.cwd ? std::filesystem::path(*req.cwd) : config_.base_dir;
    settings.timeout = req.timeout_seconds > 0 ? std::chrono::seconds(req.timeout_seconds) : config_.default_timeout;
    settings.env = req.env;
    CancellationToken token = *registry_.cancellation_token(id);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::unique_lock<std::mutex> lock(workers_mtx_);
    // shutdown() may have swapped out the workers since submit() checked.
    if (stopping_.load()) {
        lock.unlock();
        registry_.set_status(id, JobStatus::Cancelled, JobResult{});
        log_info("job " + id + " cancelled: service is shutting down");
        throw ServiceStopping();
    }
    try {
        std::thread t([this, id, settings, token, done]() {
            try {
                ProcessRunner runner(registry_, id, settings, token);
                runner.run();
            } catch (const std::exception& e) {
                log_error("job " + id + " runner failed: " + e.what());
                registry_.set_status(id, JobStatus::Error, JobResult{{}, std::nullopt, std::string(e.what())});
            }
            done->store(true);
        });
        workers_.push_back({id, std::move(t), done});
    } catch (const std::system_error& e) {
        // Thread creation failed; the job still gets a terminal status.
        registry_.set_status(id, JobStatus::Error,
                             JobResult{{}, std::nullopt, std::string("cannot start runner: ") + e.what()});
        log_error("job " + id + ": cannot start runner: " + e.what());
    }
}

void ExecutorService::join_finished_workers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mtx_);
        auto it = std::partition(workers_.begin(), workers_.end(),
                                 [](const Worker& w) { return !w.done->load(); });
        for (auto f = it; f != workers_.end(); ++f) finished.push_back(std::move(f->thread));
        workers_.erase(it, workers_.end());
    }
    for (auto& t : finished) {
        if (t.joinable()) t.join();
    }
}

StatusView ExecutorService::get_status(const std::string& id) const {
    auto job = registry_.get(id);
    if (!job) throw JobNotFound(id);
    return {job->id, job->status, job->command};
}

ResultView ExecutorService::get_result(const std::string& id) const {
    auto job = registry_.get(id);
    if (!job) throw JobNotFound(id);
    return {job->id, job->status, job->result};
}

CancelOutcome ExecutorService::cancel(const std::string& id) {
    auto status = registry_.status(id);
    if (!status) throw JobNotFound(id);
    if (is_terminal(*status)) {
        return {false, *status, std::string("Job is already ") + status_name(*status)};
    }
    auto token = registry_.cancellation_token(id);
    if (!token) throw JobNotFound(id);
    token->cancel();
    log_info("job " + id + " cancellation requested");

    auto final_status = registry_.wait_until_terminal(id, kCancelGrace);
    if (!final_status) throw JobNotFound(id);
    if (*final_status == JobStatus::Cancelled) return {true, *final_status, "Job cancelled"};
    if (*final_status == JobStatus::Running) return {false, *final_status, "Cancellation requested"};
    // The runner reached a different terminal state before it saw the token.
    return {false, *final_status, std::string("Job is already ") + status_name(*final_status)};
}

std::vector<JobSummary> ExecutorService::list() {
    sweeper_.purge();
    return registry_.list();
}

OutputSubscription ExecutorService::subscribe(const std::string& id) const {
    if (!registry_.status(id)) throw JobNotFound(id);
    return OutputSubscription(registry_, id, config_.stream_poll);
}

HealthInfo ExecutorService::health() const {
    using namespace std::chrono;
    HealthInfo h;
    h.uptime_seconds = duration_cast<duration<double>>(steady_clock::now() - started_).count();
    h.jobs_count = registry_.size();
    return h;
}

void ExecutorService::shutdown() {
    std::vector<Worker> workers;
    {
        // Under the same lock launch() checks, so no runner starts after this.
        std::lock_guard<std::mutex> lock(workers_mtx_);
        if (stopping_.exchange(true)) return;
        workers.swap(workers_);
    }
    auto running = registry_.running_ids();
    if (!running.empty()) log_info("shutdown: cancelling " + std::to_string(running.size()) + " running job(s)");
    for (const auto& id : running) {
        if (auto token = registry_.cancellation_token(id)) token->cancel();
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}
