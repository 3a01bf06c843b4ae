/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/context.hpp"
#include "jobq/errors.hpp"
#include "jobq/inbox.hpp"
#include "jobq/scheduler.hpp"
#include "jobq/server.hpp"
#include "jobq/storage.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace jobq;
using jobq::test::TempDir;
using jobq::test::seedJob;
using jobq::test::waitFor;

namespace {

SchedulerConfig
fastConfig()
{
    SchedulerConfig config;
    config.workers = 2;
    config.scanInterval = std::chrono::milliseconds(20);
    return config;
}

Request
submit(const JobId& id, const std::string& function, nlohmann::json args = nlohmann::json::array())
{
    Request request;
    request.kind = RequestKind::Submit;
    request.jobId = id;
    request.function = function;
    request.args = std::move(args);
    request.cancellable = true;
    request.trackProgress = true;
    return request;
}

Request
simple(RequestKind kind, const JobId& id = "")
{
    Request request;
    request.kind = kind;
    request.jobId = id;
    return request;
}

bool
waitForJob(Server& server, const JobId& id, State state)
{
    return waitFor([&] {
        try {
            return server.scheduler().fetchJob(id).state == state;
        } catch (const JobNotFound&) {
            return false;
        }
    });
}

class ServerTest : public ::testing::Test {
protected:
    TempDir dir;
    Server server{dir.path(), fastConfig()};
    std::unique_ptr<Inbox> client;

    void SetUp() override {
        server.registry().add("wait_for_cancel",
            [](JobContext& context, const nlohmann::json&, const nlohmann::json&) {
                auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
                while (!context.cancelRequested() && std::chrono::steady_clock::now() < deadline) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
            });
        ASSERT_TRUE(server.start());
        client = std::make_unique<Inbox>(dir.path(), false);
        ASSERT_TRUE(client->isReady());
    }

    void TearDown() override {
        server.shutdown();
    }

    void post(const Request& request) {
        auto result = client->post(request);
        ASSERT_TRUE(result) << result.message;
    }
};

}

TEST_F(ServerTest, SubmittedJobCompletes)
{
    post(submit("job-a", "sleep", {0.05}));
    ASSERT_TRUE(waitForJob(server, "job-a", State::Completed));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "jobs" / "job-a.json"));

    auto summary = server.scheduler().summary("job-a");
    EXPECT_DOUBLE_EQ(summary["percentage"].get<double>(), 1.0);
}

TEST_F(ServerTest, CancelRequestStopsRunningJob)
{
    post(submit("job-b", "wait_for_cancel"));
    ASSERT_TRUE(waitForJob(server, "job-b", State::Running));

    post(simple(RequestKind::Cancel, "job-b"));
    ASSERT_TRUE(waitForJob(server, "job-b", State::Canceled));
}

TEST_F(ServerTest, BadRequestsDoNotStopTheLoop)
{
    post(submit("job-c", "no_such_command"));
    post(simple(RequestKind::Cancel, "never-existed"));
    post(submit("job-d", "sleep", {0}));

    ASSERT_TRUE(waitForJob(server, "job-d", State::Completed));
    EXPECT_THROW((void)server.scheduler().fetchJob("job-c"), JobNotFound);
    EXPECT_EQ(client->pendingCount(), 0u);
}

TEST_F(ServerTest, EmptyThenClearAll)
{
    post(submit("job-e", "wait_for_cancel"));
    post(submit("job-f", "wait_for_cancel"));
    ASSERT_TRUE(waitForJob(server, "job-e", State::Running));
    ASSERT_TRUE(waitForJob(server, "job-f", State::Running));

    post(simple(RequestKind::Empty));
    ASSERT_TRUE(waitForJob(server, "job-e", State::Canceled));
    ASSERT_TRUE(waitForJob(server, "job-f", State::Canceled));

    post(simple(RequestKind::ClearAll));
    ASSERT_TRUE(waitFor([&] { return server.scheduler().jobs().empty(); }));
}

TEST_F(ServerTest, ClearRequestRemovesFinishedJob)
{
    post(submit("job-g", "sleep", {0}));
    ASSERT_TRUE(waitForJob(server, "job-g", State::Completed));

    post(simple(RequestKind::Clear, "job-g"));
    ASSERT_TRUE(waitFor([&] { return server.scheduler().jobs().empty(); }));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "jobs" / "job-g.json"));
}

TEST(ServerLifecycle, SchedulerOnlyWhileRunning)
{
    TempDir dir;
    Server server(dir.path(), fastConfig());
    EXPECT_THROW((void)server.scheduler(), std::logic_error);
    EXPECT_EQ(server.drainInbox(), 0u);

    ASSERT_TRUE(server.start());
    EXPECT_FALSE(server.start());
    EXPECT_NO_THROW((void)server.scheduler());

    server.shutdown();
    EXPECT_FALSE(server.isRunning());
    EXPECT_THROW((void)server.scheduler(), std::logic_error);
}

TEST(ServerLifecycle, SubmitIsPendingUntilApplied)
{
    TempDir dir;
    Inbox client(dir.path());
    ASSERT_TRUE(client.post(submit("job-p", "sleep", {0})));
    EXPECT_TRUE(client.hasPendingSubmit("job-p"));

    Server server(dir.path(), fastConfig());
    ASSERT_TRUE(server.start());
    ASSERT_TRUE(waitForJob(server, "job-p", State::Completed));
    EXPECT_FALSE(client.hasPendingSubmit("job-p"));
    server.shutdown();
}

TEST(ServerLifecycle, StartAppliesRestartPolicy)
{
    TempDir dir;
    JobId interrupted;
    {
        FileStorage storage(dir.path());
        interrupted = seedJob(storage, "sleep", State::Running).id;
    }

    Server server(dir.path(), fastConfig());
    ASSERT_TRUE(server.start());
    Job job = server.scheduler().fetchJob(interrupted);
    EXPECT_EQ(job.state, State::Failed);
    EXPECT_EQ(job.exception, "Job interrupted by process restart");
    server.shutdown();
}
