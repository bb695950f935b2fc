#pragma once
#include "job_registry.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

struct RunSettings {
    std::string command;
    std::filesystem::path cwd{"/"};
    std::chrono::milliseconds timeout{std::chrono::seconds(1200)};
    std::map<std::string, std::string> env; // overrides on top of our own environment
};

// Owns one child process for one job: spawn, incremental capture of the
// combined stdout/stderr stream, timeout, cancellation and reaping. It is the
// only writer of that job's output and status.
//
// The child runs `/bin/sh -c <command>` in its own process group; kills go to
// the whole group so background grandchildren cannot keep the pipe open.
class ProcessRunner {
public:
    ProcessRunner(JobRegistry& registry, std::string job_id, RunSettings settings, CancellationToken token);
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    // Drives the job to a terminal status and returns it. Failures are
    // recorded as JobStatus::Error rather than thrown.
    JobStatus run();

private:
    enum class ReadOutcome { Eof, TimedOut, Cancelled };

    void spawn();
    ReadOutcome read_until_eof();
    std::optional<int> wait_for_exit();
    void drain() noexcept;
    void consume(const char* data, std::size_t n);
    void flush_partial();
    void kill_and_reap() noexcept;
    void close_output() noexcept;
    JobStatus finish(JobStatus status, std::optional<int> returncode, std::optional<std::string> error);

    JobRegistry& registry_;
    std::string id_;
    RunSettings settings_;
    CancellationToken token_;
    pid_t pid_{-1};
    int out_fd_{-1};
    std::string pending_;  // bytes after the last newline
    std::string captured_; // everything appended so far
};

// Our environment with `overrides` applied, as KEY=VALUE strings.
std::vector<std::string> build_child_environment(const std::map<std::string, std::string>& overrides);

// Exit code for a waitpid() status: the exit status, or 128 + signal.
int decode_wait_status(int status);
