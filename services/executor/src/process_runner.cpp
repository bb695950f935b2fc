#include "process_runner.hpp"
#include "log.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace {
constexpr std::chrono::milliseconds kPollSlice{100};
constexpr std::chrono::milliseconds kReapPoll{10};

std::system_error sys_error(int err, const std::string& what) {
    return std::system_error(err, std::generic_category(), what);
}

[[noreturn]] void child_fail(int status_fd) {
    int err = errno;
    ssize_t w = ::write(status_fd, &err, sizeof(err));
    _exit(w == (ssize_t)sizeof(err) ? 127 : 126);
}
}

std::vector<std::string> build_child_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> env;
    for (char** p = environ; p && *p; ++p) {
        std::string kv(*p);
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& kv : overrides) env[kv.first] = kv.second;

    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& kv : env) out.push_back(kv.first + "=" + kv.second);
    return out;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

ProcessRunner::ProcessRunner(JobRegistry& registry, std::string job_id, RunSettings settings,
                             CancellationToken token)
    : registry_(registry), id_(std::move(job_id)), settings_(std::move(settings)), token_(std::move(token)) {}

ProcessRunner::~ProcessRunner() {
    kill_and_reap();
    close_output();
}

JobStatus ProcessRunner::run() {
    try {
        spawn();
        log_debug("job " + id_ + " started pid " + std::to_string(pid_) + ": " + settings_.command);
        switch (read_until_eof()) {
            case ReadOutcome::TimedOut:
                kill_and_reap();
                drain();
                return finish(JobStatus::Timeout, kTimeoutReturnCode, std::nullopt);
            case ReadOutcome::Cancelled:
                kill_and_reap();
                drain();
                return finish(JobStatus::Cancelled, std::nullopt, std::nullopt);
            case ReadOutcome::Eof:
                break;
        }
        auto rc = wait_for_exit();
        if (!rc) {
            kill_and_reap();
            return finish(JobStatus::Cancelled, std::nullopt, std::nullopt);
        }
        return finish(JobStatus::Finished, *rc, std::nullopt);
    } catch (const std::exception& e) {
        kill_and_reap();
        flush_partial();
        return finish(JobStatus::Error, std::nullopt, std::string(e.what()));
    }
}

void ProcessRunner::spawn() {
    std::error_code ec;
    fs::path cwd = fs::weakly_canonical(settings_.cwd, ec);
    if (ec) cwd = settings_.cwd;
    if (!fs::is_directory(cwd, ec)) {
        throw std::runtime_error("working directory not found: " + cwd.string());
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> env = build_child_environment(settings_.env);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& s : env) envp.push_back(s.data());
    envp.push_back(nullptr);
    const std::string cwd_str = cwd.string();
    std::string sh = "/bin/sh", dash_c = "-c", cmd = settings_.command;
    char* argv[] = {sh.data(), dash_c.data(), cmd.data(), nullptr};

    int out[2];
    if (::pipe2(out, O_CLOEXEC) != 0) throw sys_error(errno, "pipe");
    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(out[0]);
        ::close(out[1]);
        throw sys_error(err, "pipe");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(out[0]); ::close(out[1]);
        ::close(status_pipe[0]); ::close(status_pipe[1]);
        throw sys_error(err, "fork");
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        std::signal(SIGPIPE, SIG_DFL);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) ::close(devnull);
        }
        if (::dup2(out[1], STDOUT_FILENO) < 0 || ::dup2(out[1], STDERR_FILENO) < 0) child_fail(status_pipe[1]);
        if (::chdir(cwd_str.c_str()) != 0) child_fail(status_pipe[1]);
        ::execve(argv[0], argv, envp.data());
        child_fail(status_pipe[1]);
    }

    ::close(out[1]);
    ::close(status_pipe[1]);
    // Mirror the child's setpgid so a kill can never race ahead of it.
    if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        log_warn("job " + id_ + ": setpgid failed: " + std::system_category().message(errno));
    }
    pid_ = pid;
    out_fd_ = out[0];

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);
    if (n == (ssize_t)sizeof(child_errno)) {
        kill_and_reap();
        close_output();
        throw sys_error(child_errno, "cannot start /bin/sh in " + cwd_str);
    }

    int flags = ::fcntl(out_fd_, F_GETFL);
    if (flags < 0 || ::fcntl(out_fd_, F_SETFL, flags | O_NONBLOCK) != 0) throw sys_error(errno, "fcntl");
}

ProcessRunner::ReadOutcome ProcessRunner::read_until_eof() {
    // The budget starts here, after a successful spawn.
    const auto deadline = std::chrono::steady_clock::now() + settings_.timeout;
    char buf[4096];
    while (true) {
        if (token_.cancelled()) return ReadOutcome::Cancelled;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return ReadOutcome::TimedOut;
        auto slice = std::min(std::chrono::ceil<std::chrono::milliseconds>(deadline - now), kPollSlice);

        struct pollfd pfd{out_fd_, POLLIN, 0};
        int r = ::poll(&pfd, 1, (int)slice.count());
        if (r < 0) {
            if (errno == EINTR) continue;
            throw sys_error(errno, "poll");
        }
        if (r == 0) continue;

        ssize_t n = ::read(out_fd_, buf, sizeof(buf));
        if (n > 0) {
            consume(buf, (std::size_t)n);
        } else if (n == 0) {
            flush_partial();
            return ReadOutcome::Eof;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            throw sys_error(errno, "read");
        }
    }
}

std::optional<int> ProcessRunner::wait_for_exit() {
    while (true) {
        if (token_.cancelled()) return std::nullopt;
        int st = 0;
        pid_t r = ::waitpid(pid_, &st, WNOHANG);
        if (r == pid_) {
            pid_ = -1;
            return decode_wait_status(st);
        }
        if (r < 0) {
            if (errno == EINTR) continue;
            throw sys_error(errno, "waitpid");
        }
        std::this_thread::sleep_for(kReapPoll);
    }
}

void ProcessRunner::drain() noexcept {
    if (out_fd_ < 0) return;
    try {
        char buf[4096];
        ssize_t n;
        while ((n = ::read(out_fd_, buf, sizeof(buf))) > 0) consume(buf, (std::size_t)n);
        flush_partial();
    } catch (const std::exception& e) {
        log_warn("job " + id_ + ": dropping unread output: " + e.what());
    }
}

void ProcessRunner::consume(const char* data, std::size_t n) {
    pending_.append(data, n);
    std::size_t start = 0;
    for (std::size_t nl = pending_.find('\n'); nl != std::string::npos; nl = pending_.find('\n', start)) {
        std::string line = pending_.substr(start, nl - start + 1);
        captured_ += line;
        registry_.append_output(id_, std::move(line));
        start = nl + 1;
    }
    pending_.erase(0, start);
}

void ProcessRunner::flush_partial() {
    if (pending_.empty()) return;
    captured_ += pending_;
    registry_.append_output(id_, std::move(pending_));
    pending_.clear();
}

void ProcessRunner::kill_and_reap() noexcept {
    if (pid_ <= 0) return;
    // ESRCH means the group already exited; that is not a failure.
    if (::kill(-pid_, SIGKILL) != 0 && errno != ESRCH) {
        log_warn("job " + id_ + ": kill failed: " + std::system_category().message(errno));
    }
    int st = 0;
    while (::waitpid(pid_, &st, 0) < 0) {
        if (errno == EINTR) continue;
        if (errno != ECHILD) log_warn("job " + id_ + ": waitpid failed: " + std::system_category().message(errno));
        break;
    }
    pid_ = -1;
}

void ProcessRunner::close_output() noexcept {
    if (out_fd_ >= 0) {
        ::close(out_fd_);
        out_fd_ = -1;
    }
}

JobStatus ProcessRunner::finish(JobStatus status, std::optional<int> returncode, std::optional<std::string> error) {
    close_output();
    std::string detail = error ? *error : (returncode ? "rc=" + std::to_string(*returncode) : "");
    if (!registry_.set_status(id_, status, JobResult{captured_, returncode, std::move(error)})) {
        log_warn("job " + id_ + ": status " + status_name(status) + " not recorded, job no longer running");
        return registry_.status(id_).value_or(status);
    }
    if (status == JobStatus::Error) log_error("job " + id_ + " error: " + detail);
    else log_info("job " + id_ + " " + status_name(status) + (detail.empty() ? "" : " " + detail));
    return status;
}
