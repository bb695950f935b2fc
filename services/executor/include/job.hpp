#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class JobStatus : std::uint8_t { Running, Finished, Error, Cancelled, Timeout };

// Return code recorded when a job is killed for exceeding its timeout.
// Signal deaths are reported as 128 + signal, so this never collides.
constexpr int kTimeoutReturnCode = -1;

const char* status_name(JobStatus s);
std::optional<JobStatus> parse_status(const std::string& name);
inline bool is_terminal(JobStatus s) { return s != JobStatus::Running; }

struct JobRequest {
    std::string command;
    std::optional<std::string> cwd;         // defaults to the service base dir
    int timeout_seconds{0};                 // <= 0 means service default
    std::map<std::string, std::string> env; // overlaid on the service environment
};

struct JobResult {
    std::string stdout_text;          // joined output, combined stdout/stderr
    std::optional<int> returncode;
    std::optional<std::string> error; // only for JobStatus::Error
};

struct Job {
    std::string id;
    std::string command;
    std::optional<std::string> cwd;
    double created_at{0.0};  // unix seconds
    JobStatus status{JobStatus::Running};
    std::vector<std::string> output; // lines, each with its trailing newline
    std::optional<double> finished_at;
    std::optional<std::chrono::steady_clock::time_point> finished_mono;
    JobResult result;
};

struct JobSummary {
    std::string id;
    JobStatus status{JobStatus::Running};
    std::string command;
    double created_at{0.0};
};
