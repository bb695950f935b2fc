#include <gtest/gtest.h>
#include "process_runner.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <thread>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

static RunSettings settings_for(const std::string& cmd, std::chrono::milliseconds timeout = 10s) {
    RunSettings s;
    s.command = cmd;
    s.cwd = "/";
    s.timeout = timeout;
    return s;
}

// Registers a job and runs it to completion on the calling thread.
static std::pair<std::string, JobStatus> run_job(JobRegistry& reg, const RunSettings& s) {
    auto id = reg.create(JobRequest{s.command, std::nullopt, 0, {}});
    ProcessRunner runner(reg, id, s, *reg.cancellation_token(id));
    JobStatus st = runner.run();
    return {id, st};
}

// Waits until the job has produced at least `n` lines.
static bool wait_for_lines(JobRegistry& reg, const std::string& id, std::size_t n) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        auto s = reg.wait_for_output(id, 0, 50ms);
        if (s && s->next_cursor >= n) return true;
    }
    return false;
}

TEST(ProcessRunner, EchoFinishesWithOutput) {
    JobRegistry reg;
    auto [id, st] = run_job(reg, settings_for("echo hello"));
    EXPECT_EQ(st, JobStatus::Finished);
    auto job = reg.get(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Finished);
    ASSERT_EQ(job->output.size(), 1u);
    EXPECT_EQ(job->output[0], "hello\n");
    EXPECT_EQ(job->result.stdout_text, "hello\n");
    ASSERT_TRUE(job->result.returncode.has_value());
    EXPECT_EQ(*job->result.returncode, 0);
    EXPECT_FALSE(job->result.error.has_value());
    EXPECT_TRUE(job->finished_at.has_value());
}

TEST(ProcessRunner, NonZeroExitIsStillFinished) {
    JobRegistry reg;
    auto [id, st] = run_job(reg, settings_for("echo nope; exit 3"));
    EXPECT_EQ(st, JobStatus::Finished);
    EXPECT_EQ(*reg.get(id)->result.returncode, 3);
}

TEST(ProcessRunner, SignalDeathReportsShellConvention) {
    JobRegistry reg;
    auto [id, st] = run_job(reg, settings_for("kill -TERM $$"));
    EXPECT_EQ(st, JobStatus::Finished);
    EXPECT_EQ(*reg.get(id)->result.returncode, 128 + 15);
}

TEST(ProcessRunner, StderrIsMergedIntoOutput) {
    JobRegistry reg;
    auto [id, st] = run_job(reg, settings_for("echo out; echo err 1>&2"));
    EXPECT_EQ(st, JobStatus::Finished);
    auto text = reg.get(id)->result.stdout_text;
    EXPECT_NE(text.find("out\n"), std::string::npos);
    EXPECT_NE(text.find("err\n"), std::string::npos);
}

TEST(ProcessRunner, TrailingPartialLineIsKept) {
    JobRegistry reg;
    auto [id, st] = run_job(reg, settings_for("printf 'a\\nb'"));
    EXPECT_EQ(st, JobStatus::Finished);
    auto job = reg.get(id);
    ASSERT_EQ(job->output.size(), 2u);
    EXPECT_EQ(job->output[0], "a\n");
    EXPECT_EQ(job->output[1], "b");
    EXPECT_EQ(job->result.stdout_text, "a\nb");
}

TEST(ProcessRunner, TimeoutKillsAndKeepsPartialOutput) {
    JobRegistry reg;
    auto start = std::chrono::steady_clock::now();
    auto [id, st] = run_job(reg, settings_for("echo before; sleep 10", 500ms));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(st, JobStatus::Timeout);
    auto job = reg.get(id);
    EXPECT_EQ(job->result.stdout_text, "before\n");
    ASSERT_TRUE(job->result.returncode.has_value());
    EXPECT_EQ(*job->result.returncode, kTimeoutReturnCode);
    EXPECT_LT(elapsed, 5s);
}

TEST(ProcessRunner, TimeoutAlsoKillsBackgroundChildren) {
    JobRegistry reg;
    auto start = std::chrono::steady_clock::now();
    auto [id, st] = run_job(reg, settings_for("sleep 10 & sleep 10", 300ms));
    EXPECT_EQ(st, JobStatus::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(ProcessRunner, OutputIsVisibleBeforeExit) {
    JobRegistry reg;
    auto s = settings_for("echo first; sleep 3; echo second");
    auto id = reg.create(JobRequest{s.command, std::nullopt, 0, {}});
    auto token = *reg.cancellation_token(id);
    std::thread t([&] {
        ProcessRunner runner(reg, id, s, token);
        runner.run();
    });
    ASSERT_TRUE(wait_for_lines(reg, id, 1));
    auto job = reg.get(id);
    EXPECT_EQ(job->status, JobStatus::Running);
    EXPECT_EQ(job->output[0], "first\n");
    token.cancel();
    t.join();
}

TEST(ProcessRunner, CancelStopsRunningJob) {
    JobRegistry reg;
    auto s = settings_for("echo started; sleep 30");
    auto id = reg.create(JobRequest{s.command, std::nullopt, 0, {}});
    auto token = *reg.cancellation_token(id);
    JobStatus st = JobStatus::Running;
    std::thread t([&] {
        ProcessRunner runner(reg, id, s, token);
        st = runner.run();
    });
    ASSERT_TRUE(wait_for_lines(reg, id, 1));
    auto start = std::chrono::steady_clock::now();
    token.cancel();
    t.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(st, JobStatus::Cancelled);
    auto job = reg.get(id);
    EXPECT_EQ(job->status, JobStatus::Cancelled);
    EXPECT_FALSE(job->result.returncode.has_value());
    EXPECT_EQ(job->result.stdout_text, "started\n");
}

TEST(ProcessRunner, CancelRacingNaturalExit) {
    JobRegistry reg;
    auto s = settings_for("echo out");
    auto id = reg.create(JobRequest{s.command, std::nullopt, 0, {}});
    auto token = *reg.cancellation_token(id);
    token.cancel();
    ProcessRunner runner(reg, id, s, token);
    JobStatus st = runner.run();
    EXPECT_TRUE(is_terminal(st));
    auto job = reg.get(id);
    EXPECT_EQ(job->status, st);
    EXPECT_TRUE(job->result.stdout_text.empty() || job->result.stdout_text == "out\n");
}

TEST(ProcessRunner, MissingWorkingDirectoryIsError) {
    JobRegistry reg;
    auto s = settings_for("echo never");
    s.cwd = "/nonexistent/executor-test-dir";
    auto [id, st] = run_job(reg, s);
    EXPECT_EQ(st, JobStatus::Error);
    auto job = reg.get(id);
    ASSERT_TRUE(job->result.error.has_value());
    EXPECT_NE(job->result.error->find("working directory"), std::string::npos);
    EXPECT_FALSE(job->result.returncode.has_value());
    EXPECT_TRUE(job->output.empty());
}

TEST(ProcessRunner, WorkingDirectoryIsApplied) {
    JobRegistry reg;
    auto dir = fs::canonical(fs::temp_directory_path());
    auto s = settings_for("pwd -P");
    s.cwd = dir;
    auto [id, st] = run_job(reg, s);
    EXPECT_EQ(st, JobStatus::Finished);
    EXPECT_EQ(reg.get(id)->result.stdout_text, dir.string() + "\n");
}

TEST(ProcessRunner, EnvironmentOverridesAreMerged) {
    ::setenv("EXECUTOR_PARENT_VAR", "inherited", 1);
    JobRegistry reg;
    auto s = settings_for("echo \"$EXECUTOR_TEST_VAR $EXECUTOR_PARENT_VAR\"");
    s.env["EXECUTOR_TEST_VAR"] = "42";
    auto [id, st] = run_job(reg, s);
    ::unsetenv("EXECUTOR_PARENT_VAR");
    EXPECT_EQ(st, JobStatus::Finished);
    EXPECT_EQ(reg.get(id)->result.stdout_text, "42 inherited\n");
}

TEST(ProcessRunner, BuildChildEnvironmentOverrides) {
    ::setenv("EXECUTOR_ENV_PROBE", "old", 1);
    auto env = build_child_environment({{"EXECUTOR_ENV_PROBE", "new"}});
    ::unsetenv("EXECUTOR_ENV_PROBE");
    int hits = 0;
    for (const auto& kv : env) {
        if (kv.rfind("EXECUTOR_ENV_PROBE=", 0) == 0) {
            ++hits;
            EXPECT_EQ(kv, "EXECUTOR_ENV_PROBE=new");
        }
    }
    EXPECT_EQ(hits, 1);
}

TEST(ProcessRunner, PurgedJobDoesNotCrashRunner) {
    JobRegistry reg;
    auto s = settings_for("echo gone");
    auto id = reg.create(JobRequest{s.command, std::nullopt, 0, {}});
    auto token = *reg.cancellation_token(id);
    reg.remove_if([](const Job&) { return true; });
    ProcessRunner runner(reg, id, s, token);
    runner.run();
    EXPECT_FALSE(reg.get(id).has_value());
}
