/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/config.hpp"
#include "jobq/context.hpp"
#include "jobq/registry.hpp"
#include "jobq/scheduler.hpp"
#include "jobq/storage.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>

using namespace jobq;
using jobq::test::TempDir;
using jobq::test::seedJob;
using jobq::test::waitForState;

namespace {

// Records as a crashed daemon would have left them.
struct LeftBehind {
    Job scheduled;
    Job queued;
    Job running;
    Job canceling;
    Job completed;
};

LeftBehind
leaveJobsBehind(const std::filesystem::path& workspace)
{
    FileStorage storage(workspace);
    LeftBehind jobs;
    jobs.scheduled = seedJob(storage, "count", State::Scheduled);
    jobs.queued = seedJob(storage, "count", State::Queued);
    jobs.running = seedJob(storage, "count", State::Running, false, true);
    jobs.canceling = seedJob(storage, "count", State::Canceling, true);
    jobs.completed = seedJob(storage, "count", State::Completed);

    JobUpdate progress;
    progress.progress = 0.4;
    storage.update(jobs.running.id, progress);
    return jobs;
}

class RecoveryTest : public ::testing::Test {
protected:
    TempDir dir;
    Registry registry;
    std::atomic<int> runs{0};

    void SetUp() override {
        registry.add("count", [this](JobContext&, const nlohmann::json&, const nlohmann::json&) { ++runs; });
    }

    SchedulerConfig config(RestartPolicy policy) const {
        SchedulerConfig config;
        config.workers = 2;
        config.restartPolicy = policy;
        return config;
    }
};

}

TEST_F(RecoveryTest, FailPolicyFailsInterruptedJobs)
{
    auto left = leaveJobsBehind(dir.path());

    FileStorage storage(dir.path());
    Scheduler scheduler(storage, registry, config(RestartPolicy::Fail));
    ASSERT_TRUE(scheduler.start());

    for (const auto* job : {&left.scheduled, &left.queued, &left.running}) {
        Job stored = scheduler.fetchJob(job->id);
        EXPECT_EQ(stored.state, State::Failed) << job->id;
        EXPECT_EQ(stored.exception, "Job interrupted by process restart");
    }
    EXPECT_EQ(scheduler.fetchJob(left.canceling.id).state, State::Canceled);
    EXPECT_EQ(scheduler.fetchJob(left.completed.id).state, State::Completed);

    scheduler.stop();
    EXPECT_EQ(runs.load(), 0);
}

TEST_F(RecoveryTest, RequeuePolicyRunsInterruptedJobsAgain)
{
    auto left = leaveJobsBehind(dir.path());

    FileStorage storage(dir.path());
    Scheduler scheduler(storage, registry, config(RestartPolicy::Requeue));
    ASSERT_TRUE(scheduler.start());

    for (const auto* job : {&left.scheduled, &left.queued, &left.running}) {
        EXPECT_TRUE(waitForState(scheduler, job->id, State::Completed)) << job->id;
    }
    EXPECT_EQ(scheduler.fetchJob(left.canceling.id).state, State::Canceled);
    EXPECT_EQ(scheduler.fetchJob(left.completed.id).state, State::Completed);

    scheduler.stop();
    EXPECT_EQ(runs.load(), 3);
}

TEST_F(RecoveryTest, RestartInSameProcessKeepsQueuedJobs)
{
    FileStorage storage(dir.path());
    Scheduler scheduler(storage, registry, config(RestartPolicy::Fail));
    ASSERT_TRUE(scheduler.start());
    scheduler.stop();

    auto id = scheduler.enqueue("count");
    EXPECT_EQ(scheduler.fetchJob(id).state, State::Queued);

    ASSERT_TRUE(scheduler.start());
    ASSERT_TRUE(waitForState(scheduler, id, State::Completed));
    scheduler.stop();
    EXPECT_EQ(runs.load(), 1);
}

TEST_F(RecoveryTest, QueuedJobsSurviveCleanShutdownWithRequeue)
{
    {
        FileStorage storage(dir.path());
        Scheduler scheduler(storage, registry, config(RestartPolicy::Requeue));
        (void)scheduler.enqueue("count");
        (void)scheduler.enqueue("count");
    }

    FileStorage storage(dir.path());
    Scheduler scheduler(storage, registry, config(RestartPolicy::Requeue));
    ASSERT_TRUE(scheduler.start());
    for (const auto& job : scheduler.jobs()) {
        EXPECT_TRUE(waitForState(scheduler, job.id, State::Completed)) << job.id;
    }
    scheduler.stop();
    EXPECT_EQ(runs.load(), 2);
}

TEST(SchedulerConfig, RestartPolicyNames)
{
    EXPECT_TRUE(restartPolicyFromString("fail") == RestartPolicy::Fail);
    EXPECT_TRUE(restartPolicyFromString("REQUEUE") == RestartPolicy::Requeue);
    EXPECT_FALSE(restartPolicyFromString("retry").has_value());
    EXPECT_STREQ(restartPolicyToString(RestartPolicy::Requeue), "requeue");
}

TEST(SchedulerConfig, FromEnvironment)
{
    setenv("JOBQ_WORKERS", "9", 1);
    setenv("JOBQ_RESTART_POLICY", "requeue", 1);
    setenv("JOBQ_SCAN_INTERVAL_MS", "125", 1);
    auto config = SchedulerConfig::fromEnv();
    EXPECT_EQ(config.workers, 9);
    EXPECT_TRUE(config.restartPolicy == RestartPolicy::Requeue);
    EXPECT_EQ(config.scanInterval, std::chrono::milliseconds(125));

    setenv("JOBQ_WORKERS", "-3", 1);
    setenv("JOBQ_RESTART_POLICY", "sometimes", 1);
    setenv("JOBQ_SCAN_INTERVAL_MS", "soon", 1);
    config = SchedulerConfig::fromEnv();
    EXPECT_EQ(config.workers, 4);
    EXPECT_TRUE(config.restartPolicy == RestartPolicy::Fail);
    EXPECT_EQ(config.scanInterval, std::chrono::milliseconds(500));

    setenv("JOBQ_WORKERS", "100000", 1);
    EXPECT_EQ(SchedulerConfig::fromEnv().workers, 256);

    unsetenv("JOBQ_WORKERS");
    unsetenv("JOBQ_RESTART_POLICY");
    unsetenv("JOBQ_SCAN_INTERVAL_MS");
}
