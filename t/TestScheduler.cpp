/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/context.hpp"
#include "jobq/errors.hpp"
#include "jobq/registry.hpp"
#include "jobq/scheduler.hpp"
#include "jobq/storage.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace jobq;
using jobq::test::Gate;
using jobq::test::TempDir;
using jobq::test::waitFor;
using jobq::test::waitForState;

namespace {

// Passes everything through to a MemoryStorage unless told to fail.
class FaultyStorage final : public Storage {
public:
    std::atomic<bool> failCreate{false};
    std::atomic<bool> failProgress{false};

    void create(Job& job) override {
        if (failCreate) {
            throw StorageError("disk full");
        }
        inner_.create(job);
    }

    bool update(const JobId& id, const JobUpdate& update) override {
        if (failProgress && update.progress && !update.state) {
            throw StorageError("progress write failed");
        }
        return inner_.update(id, update);
    }

    std::optional<Job> get(const JobId& id) const override { return inner_.get(id); }
    std::vector<Job> list() const override { return inner_.list(); }
    bool remove(const JobId& id) override { return inner_.remove(id); }
    std::size_t removeAll() override { return inner_.removeAll(); }

private:
    MemoryStorage inner_;
};

SchedulerConfig
config(int workers)
{
    SchedulerConfig config;
    config.workers = workers;
    return config;
}

EnqueueOptions
cancellable(bool trackProgress = false)
{
    EnqueueOptions options;
    options.cancellable = true;
    options.trackProgress = trackProgress;
    return options;
}

class SchedulerTest : public ::testing::Test {
protected:
    MemoryStorage storage;
    Registry registry;
    std::unique_ptr<Scheduler> scheduler;

    void SetUp() override {
        registry.add("noop", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {});
        registry.add("fail", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {
            throw std::runtime_error("it broke");
        });
    }

    void startWith(int workers) {
        scheduler = std::make_unique<Scheduler>(storage, registry, config(workers));
        ASSERT_TRUE(scheduler->start());
    }

    void TearDown() override {
        if (scheduler) {
            scheduler->stop();
        }
    }
};

}

TEST_F(SchedulerTest, UnknownFunctionIsRejected)
{
    startWith(1);
    EXPECT_THROW(scheduler->enqueue("does_not_exist"), InvalidFunctionError);
    EXPECT_TRUE(scheduler->jobs().empty());
}

TEST_F(SchedulerTest, MalformedArgumentsAreRejected)
{
    startWith(1);
    EXPECT_THROW(scheduler->enqueue("noop", nlohmann::json::object()), std::invalid_argument);
    EXPECT_THROW(scheduler->enqueue("noop", nlohmann::json::array(), nlohmann::json::array()),
                 std::invalid_argument);

    EnqueueOptions options;
    options.extraMetadata = "not an object";
    EXPECT_THROW(scheduler->enqueue("noop", nlohmann::json::array(), nlohmann::json::object(), options),
                 std::invalid_argument);
    EXPECT_TRUE(scheduler->jobs().empty());
}

TEST_F(SchedulerTest, CompletedJobHasFullProgress)
{
    registry.add("add", [](JobContext& context, const nlohmann::json& args, const nlohmann::json& kwargs) {
        if (args.at(0).get<int>() + kwargs.at("b").get<int>() != 5) {
            throw std::runtime_error("wrong arguments");
        }
        context.updateProgress(1, 4);
    });
    startWith(2);

    auto id = scheduler->enqueue("add", {2}, {{"b", 3}}, cancellable(true));
    ASSERT_TRUE(waitForState(*scheduler, id, State::Completed));

    auto summary = scheduler->summary(id);
    EXPECT_EQ(summary["status"], "COMPLETED");
    EXPECT_DOUBLE_EQ(summary["percentage"].get<double>(), 1.0);
    EXPECT_EQ(summary["exception"], "");
}

TEST_F(SchedulerTest, UntrackedProgressStaysZero)
{
    registry.add("report", [](JobContext& context, const nlohmann::json&, const nlohmann::json&) {
        context.updateProgress(0.5);
    });
    startWith(1);

    auto id = scheduler->enqueue("report");
    ASSERT_TRUE(waitForState(*scheduler, id, State::Completed));
    EXPECT_DOUBLE_EQ(scheduler->fetchJob(id).percentage_progress, 0.0);
}

TEST_F(SchedulerTest, ProgressNeverMovesBackwards)
{
    Gate reported;
    Gate release;
    registry.add("wobble", [&](JobContext& context, const nlohmann::json&, const nlohmann::json&) {
        context.updateProgress(0.6);
        context.updateProgress(0.3);
        context.updateProgress(7.0, 0.0);
        reported.open();
        release.wait();
    });
    startWith(1);

    auto id = scheduler->enqueue("wobble", {}, {}, cancellable(true));
    ASSERT_TRUE(reported.wait());
    EXPECT_DOUBLE_EQ(scheduler->fetchJob(id).percentage_progress, 0.6);
    release.open();
    ASSERT_TRUE(waitForState(*scheduler, id, State::Completed));
}

TEST_F(SchedulerTest, FailureRecordsExceptionAndTraceback)
{
    startWith(1);
    auto id = scheduler->enqueue("fail", {"x"}, {{"k", 1}});
    ASSERT_TRUE(waitForState(*scheduler, id, State::Failed));

    Job job = scheduler->fetchJob(id);
    EXPECT_EQ(job.exception, "it broke");
    EXPECT_NE(job.traceback.find("std::runtime_error: it broke"), std::string::npos);
    EXPECT_NE(job.traceback.find("function fail"), std::string::npos);
    EXPECT_NE(job.traceback.find("[\"x\"]"), std::string::npos);
}

TEST_F(SchedulerTest, TracebackFollowsNestedExceptions)
{
    registry.add("nested", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {
        try {
            throw std::out_of_range("index 9");
        } catch (const std::exception&) {
            std::throw_with_nested(std::runtime_error("lookup failed"));
        }
    });
    startWith(1);

    auto id = scheduler->enqueue("nested");
    ASSERT_TRUE(waitForState(*scheduler, id, State::Failed));

    Job job = scheduler->fetchJob(id);
    EXPECT_EQ(job.exception, "lookup failed");
    auto outer = job.traceback.find("#0");
    auto inner = job.traceback.find("#1 std::out_of_range: index 9");
    EXPECT_NE(outer, std::string::npos);
    EXPECT_NE(inner, std::string::npos);
    EXPECT_LT(outer, inner);
}

TEST_F(SchedulerTest, NonStandardExceptionFailsJob)
{
    registry.add("weird", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {
        throw 42;
    });
    startWith(1);

    auto id = scheduler->enqueue("weird");
    ASSERT_TRUE(waitForState(*scheduler, id, State::Failed));
    EXPECT_EQ(scheduler->fetchJob(id).exception, "Unknown error");
}

TEST_F(SchedulerTest, CancelRunningJobKeepsProgress)
{
    Gate halfway;
    Gate release;
    registry.add("halves", [&](JobContext& context, const nlohmann::json&, const nlohmann::json&) {
        context.updateProgress(0.5);
        halfway.open();
        release.wait();
        context.checkForCancel();
        context.updateProgress(1.0);
    });
    startWith(1);

    auto id = scheduler->enqueue("halves", {}, {}, cancellable(true));
    ASSERT_TRUE(halfway.wait());

    scheduler->cancel(id);
    EXPECT_EQ(scheduler->fetchJob(id).state, State::Canceling);
    EXPECT_EQ(scheduler->summary(id)["status"], "CANCELING");

    release.open();
    ASSERT_TRUE(waitForState(*scheduler, id, State::Canceled));
    EXPECT_DOUBLE_EQ(scheduler->fetchJob(id).percentage_progress, 0.5);
}

TEST_F(SchedulerTest, BodyThatObservesCancelAndReturnsIsCanceled)
{
    Gate started;
    registry.add("polite", [&](JobContext& context, const nlohmann::json&, const nlohmann::json&) {
        started.open();
        while (!context.cancelRequested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
    startWith(1);

    auto id = scheduler->enqueue("polite", {}, {}, cancellable());
    ASSERT_TRUE(started.wait());
    scheduler->cancel(id);
    ASSERT_TRUE(waitForState(*scheduler, id, State::Canceled));
}

TEST_F(SchedulerTest, BodyIgnoringCancelStillCompletes)
{
    Gate started;
    Gate release;
    registry.add("stubborn", [&](JobContext&, const nlohmann::json&, const nlohmann::json&) {
        started.open();
        release.wait();
    });
    startWith(1);

    auto id = scheduler->enqueue("stubborn", {}, {}, cancellable());
    ASSERT_TRUE(started.wait());
    scheduler->cancel(id);
    release.open();
    ASSERT_TRUE(waitForState(*scheduler, id, State::Completed));
}

TEST_F(SchedulerTest, NewJobHasNoProgress)
{
    Gate started;
    Gate release;
    registry.add("block", [&](JobContext&, const nlohmann::json&, const nlohmann::json&) {
        started.open();
        release.wait();
    });

    scheduler = std::make_unique<Scheduler>(storage, registry, config(1));
    auto idle = scheduler->enqueue("noop", {}, {}, cancellable(true));
    Job job = scheduler->fetchJob(idle);
    EXPECT_EQ(job.state, State::Queued);
    EXPECT_DOUBLE_EQ(job.percentage_progress, 0.0);
    scheduler->cancel(idle);

    ASSERT_TRUE(scheduler->start());
    auto busy = scheduler->enqueue("block", {}, {}, cancellable(true));
    ASSERT_TRUE(started.wait());

    auto waiting = scheduler->enqueue("noop", {}, {}, cancellable(true));
    job = scheduler->fetchJob(waiting);
    EXPECT_TRUE(job.state == State::Scheduled || job.state == State::Queued) << stateToString(job.state);
    EXPECT_DOUBLE_EQ(job.percentage_progress, 0.0);
    EXPECT_DOUBLE_EQ(scheduler->summary(waiting)["percentage"].get<double>(), 0.0);

    release.open();
    ASSERT_TRUE(waitForState(*scheduler, busy, State::Completed));
    ASSERT_TRUE(waitForState(*scheduler, waiting, State::Completed));
}

TEST_F(SchedulerTest, CancelQueuedJobBeforeItRuns)
{
    std::atomic<int> runs{0};
    registry.add("count", [&](JobContext&, const nlohmann::json&, const nlohmann::json&) { ++runs; });

    // Not started: jobs stay QUEUED
    scheduler = std::make_unique<Scheduler>(storage, registry, config(1));
    auto id = scheduler->enqueue("count", {}, {}, cancellable());
    EXPECT_EQ(scheduler->fetchJob(id).state, State::Queued);

    scheduler->cancel(id);
    EXPECT_EQ(scheduler->fetchJob(id).state, State::Canceled);

    ASSERT_TRUE(scheduler->start());
    auto other = scheduler->enqueue("count");
    ASSERT_TRUE(waitForState(*scheduler, other, State::Completed));
    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(scheduler->fetchJob(id).state, State::Canceled);
}

TEST_F(SchedulerTest, CancelIsIgnoredForNonCancellableAndFinishedJobs)
{
    Gate started;
    Gate release;
    registry.add("block", [&](JobContext&, const nlohmann::json&, const nlohmann::json&) {
        started.open();
        release.wait();
    });
    startWith(1);

    auto id = scheduler->enqueue("block");
    ASSERT_TRUE(started.wait());
    scheduler->cancel(id);
    EXPECT_EQ(scheduler->fetchJob(id).state, State::Running);
    release.open();
    ASSERT_TRUE(waitForState(*scheduler, id, State::Completed));

    auto failed = scheduler->enqueue("fail", {}, {}, cancellable());
    ASSERT_TRUE(waitForState(*scheduler, failed, State::Failed));
    scheduler->cancel(failed);
    EXPECT_EQ(scheduler->fetchJob(failed).state, State::Failed);

    EXPECT_THROW(scheduler->cancel("no-such-job"), JobNotFound);
}

TEST_F(SchedulerTest, EmptyCancelsEverythingUnfinished)
{
    Gate started;
    Gate release;
    registry.add("block", [&](JobContext& context, const nlohmann::json&, const nlohmann::json&) {
        started.open();
        release.wait();
        context.checkForCancel();
    });
    startWith(1);

    auto running = scheduler->enqueue("block", {}, {}, cancellable());
    ASSERT_TRUE(started.wait());
    std::vector<JobId> queued;
    for (int i = 0; i < 3; ++i) {
        queued.push_back(scheduler->enqueue("noop", {}, {}, cancellable()));
    }

    scheduler->empty();

    EXPECT_EQ(scheduler->fetchJob(running).state, State::Canceling);
    for (const auto& id : queued) {
        EXPECT_EQ(scheduler->fetchJob(id).state, State::Canceled);
    }

    release.open();
    ASSERT_TRUE(waitForState(*scheduler, running, State::Canceled));
    for (const auto& id : queued) {
        EXPECT_EQ(scheduler->fetchJob(id).state, State::Canceled);
    }
}

TEST_F(SchedulerTest, ClearRemovesOnlyFinishedJobs)
{
    Gate started;
    Gate release;
    registry.add("block", [&](JobContext&, const nlohmann::json&, const nlohmann::json&) {
        started.open();
        release.wait();
    });
    startWith(2);

    auto done = scheduler->enqueue("noop");
    auto failed = scheduler->enqueue("fail");
    ASSERT_TRUE(waitForState(*scheduler, done, State::Completed));
    ASSERT_TRUE(waitForState(*scheduler, failed, State::Failed));
    auto running = scheduler->enqueue("block");
    ASSERT_TRUE(started.wait());

    EXPECT_FALSE(scheduler->clearJob(running));
    EXPECT_TRUE(scheduler->clearJob(done));
    EXPECT_THROW((void)scheduler->fetchJob(done), JobNotFound);
    EXPECT_THROW(scheduler->clearJob(done), JobNotFound);

    EXPECT_EQ(scheduler->clear(), 1u);
    auto remaining = scheduler->jobs();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, running);

    release.open();
    ASSERT_TRUE(waitForState(*scheduler, running, State::Completed));
}

TEST_F(SchedulerTest, SingleWorkerRunsJobsInEnqueueOrder)
{
    std::mutex mutex;
    std::vector<int> order;
    registry.add("record", [&](JobContext&, const nlohmann::json& args, const nlohmann::json&) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(args.at(0).get<int>());
    });
    startWith(1);

    JobId last;
    for (int i = 0; i < 10; ++i) {
        last = scheduler->enqueue("record", {i});
    }
    ASSERT_TRUE(waitForState(*scheduler, last, State::Completed));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST_F(SchedulerTest, EachJobRunsOnceUnderRepeatedDispatch)
{
    std::mutex mutex;
    std::map<JobId, int> runs;
    registry.add("tally", [&](JobContext& context, const nlohmann::json&, const nlohmann::json&) {
        std::lock_guard<std::mutex> lock(mutex);
        ++runs[context.jobId()];
    });
    startWith(4);

    std::atomic<bool> done{false};
    std::thread dispatcher([&] {
        while (!done) {
            scheduler->dispatchQueued();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    std::vector<JobId> ids;
    std::mutex idsMutex;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                auto id = scheduler->enqueue("tally");
                std::lock_guard<std::mutex> lock(idsMutex);
                ids.push_back(id);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    ASSERT_TRUE(waitFor([&] {
        for (const auto& id : ids) {
            if (scheduler->fetchJob(id).state != State::Completed) {
                return false;
            }
        }
        return true;
    }));
    done = true;
    dispatcher.join();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(runs.size(), 100u);
    for (const auto& entry : runs) {
        EXPECT_EQ(entry.second, 1) << entry.first;
    }
}

TEST_F(SchedulerTest, JobsListAndSummaryMetadata)
{
    startWith(1);
    EnqueueOptions options;
    options.extraMetadata = {{"type", "DISKEXPORT"}, {"started_by", "admin"}};
    options.jobId = std::string("chosen-id");

    auto first = scheduler->enqueue("noop", {}, {}, options);
    auto second = scheduler->enqueue("noop");
    EXPECT_EQ(first, "chosen-id");

    auto jobs = scheduler->jobs();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].id, first);
    EXPECT_EQ(jobs[1].id, second);

    auto summary = scheduler->summary(first);
    EXPECT_EQ(summary["type"], "DISKEXPORT");
    EXPECT_EQ(summary["started_by"], "admin");
    EXPECT_EQ(summary["id"], "chosen-id");

    EXPECT_THROW(scheduler->enqueue("noop", {}, {}, options), StorageError);
    EXPECT_THROW((void)scheduler->summary("unknown"), JobNotFound);
}

TEST(SchedulerIds, ClearedIdIsNotAcceptedAgain)
{
    TempDir dir;
    FileStorage storage(dir.path());
    Registry registry;
    registry.add("noop", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {});
    Scheduler scheduler(storage, registry, config(1));
    ASSERT_TRUE(scheduler.start());

    EnqueueOptions options;
    options.jobId = std::string("reused-id");
    auto id = scheduler.enqueue("noop", {}, {}, options);
    ASSERT_TRUE(waitForState(scheduler, id, State::Completed));
    ASSERT_TRUE(scheduler.clearJob(id));

    EXPECT_THROW(scheduler.enqueue("noop", {}, {}, options), StorageError);
    EXPECT_THROW((void)scheduler.fetchJob(id), JobNotFound);
    scheduler.stop();
}

TEST(SchedulerStorageFaults, CreateFailureReachesCaller)
{
    FaultyStorage storage;
    Registry registry;
    registry.add("noop", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {});
    Scheduler scheduler(storage, registry, config(1));
    ASSERT_TRUE(scheduler.start());

    storage.failCreate = true;
    EXPECT_THROW(scheduler.enqueue("noop"), StorageError);
    EXPECT_TRUE(scheduler.jobs().empty());
    scheduler.stop();
}

TEST(SchedulerStorageFaults, ProgressWriteFailureFailsJob)
{
    FaultyStorage storage;
    Registry registry;
    registry.add("report", [](JobContext& context, const nlohmann::json&, const nlohmann::json&) {
        context.updateProgress(0.5);
    });
    Scheduler scheduler(storage, registry, config(1));
    ASSERT_TRUE(scheduler.start());

    storage.failProgress = true;
    EnqueueOptions options;
    options.trackProgress = true;
    auto id = scheduler.enqueue("report", {}, {}, options);
    ASSERT_TRUE(waitForState(scheduler, id, State::Failed));
    EXPECT_EQ(scheduler.fetchJob(id).exception, "progress write failed");
    scheduler.stop();
}

TEST(Registry, RejectsEmptyEntries)
{
    Registry registry;
    EXPECT_THROW(registry.add("", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {}),
                 InvalidFunctionError);
    EXPECT_THROW(registry.add("nothing", JobFunction()), InvalidFunctionError);
    EXPECT_THROW((void)registry.resolve("nothing"), InvalidFunctionError);
    EXPECT_FALSE(registry.contains("nothing"));

    registry.add("b", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {});
    registry.add("a", [](JobContext&, const nlohmann::json&, const nlohmann::json&) {});
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"a", "b"}));
}
