#pragma once
#include "job.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Shared flag a runner polls at each suspension point.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Output lines from a cursor onward, read together with the status so a
// terminal status is never paired with a partial output prefix.
struct OutputSlice {
    std::vector<std::string> lines;
    std::size_t next_cursor{0};
    JobStatus status{JobStatus::Running};
};

class JobRegistry {
public:
    std::string create(const JobRequest& req);
    std::optional<Job> get(const std::string& id) const;
    std::optional<JobStatus> status(const std::string& id) const;
    std::optional<CancellationToken> cancellation_token(const std::string& id) const;
    std::vector<JobSummary> list() const;
    std::vector<std::string> running_ids() const;
    std::size_t size() const;

    // Writer side. Both return false once the job is terminal or gone.
    bool append_output(const std::string& id, std::string line);
    bool set_status(const std::string& id, JobStatus status, JobResult result);

    std::optional<OutputSlice> read_from(const std::string& id, std::size_t cursor) const;
    // Like read_from, but first waits up to `timeout` for new output or a
    // terminal status.
    std::optional<OutputSlice> wait_for_output(const std::string& id, std::size_t cursor,
                                               std::chrono::milliseconds timeout) const;
    std::optional<JobStatus> wait_until_terminal(const std::string& id,
                                                 std::chrono::milliseconds timeout) const;

    std::size_t remove_if(const std::function<bool(const Job&)>& pred);

private:
    struct Entry {
        mutable std::mutex mtx;
        mutable std::condition_variable cv;
        Job job;
        CancellationToken token;
    };
    std::shared_ptr<Entry> find(const std::string& id) const;
    static OutputSlice slice_locked(const Entry& e, std::size_t cursor);

    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> jobs_;
    std::vector<std::string> order_; // insertion order
};

std::string gen_job_id();
