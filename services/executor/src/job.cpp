#include "job.hpp"

const char* status_name(JobStatus s) {
    switch (s) {
        case JobStatus::Running: return "running";
        case JobStatus::Finished: return "finished";
        case JobStatus::Error: return "error";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Timeout: return "timeout";
    }
    return "unknown";
}

std::optional<JobStatus> parse_status(const std::string& name) {
    if (name == "running") return JobStatus::Running;
    if (name == "finished") return JobStatus::Finished;
    if (name == "error") return JobStatus::Error;
    if (name == "cancelled") return JobStatus::Cancelled;
    if (name == "timeout") return JobStatus::Timeout;
    return std::nullopt;
}
