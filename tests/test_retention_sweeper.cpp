#include <gtest/gtest.h>
#include "retention_sweeper.hpp"

using namespace std::chrono_literals;

TEST(RetentionSweeper, KeepsRunningJobs) {
    JobRegistry reg;
    RetentionSweeper sweeper(reg, 3600s);
    auto id = reg.create(JobRequest{"sleep 100", std::nullopt, 0, {}});
    EXPECT_EQ(sweeper.purge(std::chrono::steady_clock::now() + 10h), 0u);
    EXPECT_TRUE(reg.get(id).has_value());
}

TEST(RetentionSweeper, PurgesTerminalJobsPastTtl) {
    JobRegistry reg;
    RetentionSweeper sweeper(reg, 3600s);
    auto done = reg.create(JobRequest{"true", std::nullopt, 0, {}});
    auto running = reg.create(JobRequest{"sleep 100", std::nullopt, 0, {}});
    reg.set_status(done, JobStatus::Finished, JobResult{"", 0, std::nullopt});

    auto now = std::chrono::steady_clock::now();
    EXPECT_EQ(sweeper.purge(now), 0u);
    EXPECT_EQ(sweeper.purge(now + 3599s), 0u);
    EXPECT_EQ(sweeper.purge(now + 3601s), 1u);
    EXPECT_FALSE(reg.get(done).has_value());
    EXPECT_TRUE(reg.get(running).has_value());
}

TEST(RetentionSweeper, EveryTerminalStatusIsEligible) {
    JobRegistry reg;
    RetentionSweeper sweeper(reg, 1s);
    for (auto st : {JobStatus::Finished, JobStatus::Error, JobStatus::Cancelled, JobStatus::Timeout}) {
        auto id = reg.create(JobRequest{"x", std::nullopt, 0, {}});
        reg.set_status(id, st, JobResult{});
    }
    EXPECT_EQ(sweeper.purge(std::chrono::steady_clock::now() + 2s), 4u);
    EXPECT_EQ(reg.size(), 0u);
}
