#include "job_registry.hpp"
#include <algorithm>
#include <cstdio>
#include <random>

std::string gen_job_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return std::string(buf);
}

static double unix_now() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

std::string JobRegistry::create(const JobRequest& req) {
    auto e = std::make_shared<Entry>();
    e->job.command = req.command;
    e->job.cwd = req.cwd;
    e->job.created_at = unix_now();
    e->job.status = JobStatus::Running;

    std::lock_guard<std::mutex> lock(mtx_);
    std::string id;
    do { id = gen_job_id(); } while (jobs_.count(id));
    e->job.id = id;
    jobs_.emplace(id, std::move(e));
    order_.push_back(id);
    return id;
}

std::shared_ptr<JobRegistry::Entry> JobRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return nullptr;
    return it->second;
}

std::optional<Job> JobRegistry::get(const std::string& id) const {
    auto e = find(id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lock(e->mtx);
    return e->job;
}

std::optional<JobStatus> JobRegistry::status(const std::string& id) const {
    auto e = find(id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lock(e->mtx);
    return e->job.status;
}

std::optional<CancellationToken> JobRegistry::cancellation_token(const std::string& id) const {
    auto e = find(id);
    if (!e) return std::nullopt;
    return e->token;
}

std::vector<JobSummary> JobRegistry::list() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        entries.reserve(order_.size());
        for (const auto& id : order_) entries.push_back(jobs_.at(id));
    }
    std::vector<JobSummary> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        std::lock_guard<std::mutex> lock(e->mtx);
        out.push_back({e->job.id, e->job.status, e->job.command, e->job.created_at});
    }
    return out;
}

std::vector<std::string> JobRegistry::running_ids() const {
    std::vector<std::string> out;
    for (const auto& s : list()) {
        if (s.status == JobStatus::Running) out.push_back(s.id);
    }
    return out;
}

std::size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return jobs_.size();
}

bool JobRegistry::append_output(const std::string& id, std::string line) {
    auto e = find(id);
    if (!e) return false;
    {
        std::lock_guard<std::mutex> lock(e->mtx);
        if (is_terminal(e->job.status)) return false;
        e->job.output.push_back(std::move(line));
    }
    e->cv.notify_all();
    return true;
}

bool JobRegistry::set_status(const std::string& id, JobStatus status, JobResult result) {
    if (!is_terminal(status)) return false;
    auto e = find(id);
    if (!e) return false;
    {
        std::lock_guard<std::mutex> lock(e->mtx);
        if (is_terminal(e->job.status)) return false;
        e->job.status = status;
        e->job.result = std::move(result);
        e->job.finished_at = unix_now();
        e->job.finished_mono = std::chrono::steady_clock::now();
    }
    e->cv.notify_all();
    return true;
}

OutputSlice JobRegistry::slice_locked(const Entry& e, std::size_t cursor) {
    OutputSlice s;
    const auto& out = e.job.output;
    if (cursor < out.size()) s.lines.assign(out.begin() + (std::ptrdiff_t)cursor, out.end());
    s.next_cursor = std::max(cursor, out.size());
    s.status = e.job.status;
    return s;
}

std::optional<OutputSlice> JobRegistry::read_from(const std::string& id, std::size_t cursor) const {
    auto e = find(id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lock(e->mtx);
    return slice_locked(*e, cursor);
}

std::optional<OutputSlice> JobRegistry::wait_for_output(const std::string& id, std::size_t cursor,
                                                        std::chrono::milliseconds timeout) const {
    auto e = find(id);
    if (!e) return std::nullopt;
    {
        std::unique_lock<std::mutex> lock(e->mtx);
        e->cv.wait_for(lock, timeout, [&] {
            return e->job.output.size() > cursor || is_terminal(e->job.status);
        });
    }
    // Re-resolve: the job may have been purged while we waited.
    return read_from(id, cursor);
}

std::optional<JobStatus> JobRegistry::wait_until_terminal(const std::string& id,
                                                          std::chrono::milliseconds timeout) const {
    auto e = find(id);
    if (!e) return std::nullopt;
    std::unique_lock<std::mutex> lock(e->mtx);
    e->cv.wait_for(lock, timeout, [&] { return is_terminal(e->job.status); });
    return e->job.status;
}

std::size_t JobRegistry::remove_if(const std::function<bool(const Job&)>& pred) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        bool drop;
        {
            std::lock_guard<std::mutex> elock(it->second->mtx);
            drop = pred(it->second->job);
        }
        if (drop) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed) {
        order_.erase(std::remove_if(order_.begin(), order_.end(),
                                    [&](const std::string& id) { return !jobs_.count(id); }),
                     order_.end());
    }
    return removed;
}
