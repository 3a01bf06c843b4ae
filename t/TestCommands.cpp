/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/commands.hpp"
#include "jobq/context.hpp"
#include "jobq/errors.hpp"
#include "jobq/registry.hpp"
#include "jobq/scheduler.hpp"
#include "jobq/storage.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <thread>

using namespace jobq;
using jobq::test::TempDir;
using jobq::test::seedJob;
using jobq::test::waitForState;

namespace {

void
writeFile(const std::filesystem::path& path, const std::string& content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

std::string
readFile(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    std::ostringstream out;
    out << file.rdbuf();
    return out.str();
}

void
requestCancel(Storage& storage, const JobId& id)
{
    JobUpdate update;
    update.state = State::Canceling;
    update.expected = {State::Running};
    ASSERT_TRUE(storage.update(id, update));
}

class CommandTest : public ::testing::Test {
protected:
    MemoryStorage storage;
    Job job = seedJob(storage, "command", State::Running, true, true);
    JobContext context{storage, job};

    double storedProgress() const { return storage.get(job.id)->percentage_progress; }
};

}

TEST_F(CommandTest, SleepReportsProgress)
{
    sleepCommand(context, nlohmann::json::array({0.35}), nlohmann::json::object());
    EXPECT_GT(storedProgress(), 0.5);
    EXPECT_LE(storedProgress(), 1.0);
}

TEST_F(CommandTest, SleepTakesKeywordArgument)
{
    sleepCommand(context, nlohmann::json::array(), {{"seconds", 0}});
    EXPECT_FALSE(context.cancelObserved());
}

TEST_F(CommandTest, SleepRejectsBadDuration)
{
    EXPECT_THROW(sleepCommand(context, nlohmann::json::array({-1}), nlohmann::json::object()),
                 std::invalid_argument);
    EXPECT_THROW(sleepCommand(context, nlohmann::json::array({"ten"}), nlohmann::json::object()),
                 std::invalid_argument);
    EXPECT_THROW(sleepCommand(context, nlohmann::json::array(), nlohmann::json::object()),
                 std::invalid_argument);
    EXPECT_THROW(sleepCommand(context, nlohmann::json::array({1e300}), nlohmann::json::object()),
                 std::invalid_argument);
    EXPECT_THROW(sleepCommand(context, nlohmann::json::object(), {{"seconds", 400.0 * 24 * 3600}}),
                 std::invalid_argument);
}

TEST_F(CommandTest, SleepStopsOnCancel)
{
    std::thread canceler([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        requestCancel(storage, job.id);
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(sleepCommand(context, nlohmann::json::array({30}), nlohmann::json::object()),
                 JobCancelled);
    canceler.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(context.cancelObserved());
}

TEST_F(CommandTest, CopyTree)
{
    TempDir dir;
    auto source = dir.path() / "src";
    auto destination = dir.path() / "dst";
    writeFile(source / "a.txt", "alpha");
    writeFile(source / "nested" / "b.txt", std::string(4096, 'b'));
    writeFile(source / "nested" / "deeper" / "c.txt", "");

    copyCommand(context, nlohmann::json::array({source.string(), destination.string()}),
                nlohmann::json::object());

    EXPECT_EQ(readFile(destination / "a.txt"), "alpha");
    EXPECT_EQ(readFile(destination / "nested" / "b.txt"), std::string(4096, 'b'));
    EXPECT_TRUE(std::filesystem::exists(destination / "nested" / "deeper" / "c.txt"));
    EXPECT_DOUBLE_EQ(storedProgress(), 1.0);
}

TEST_F(CommandTest, CopySingleFileByKeyword)
{
    TempDir dir;
    writeFile(dir.path() / "one.bin", "payload");

    copyCommand(context, nlohmann::json::array(),
                {{"source", (dir.path() / "one.bin").string()},
                 {"destination", (dir.path() / "out" / "two.bin").string()}});
    EXPECT_EQ(readFile(dir.path() / "out" / "two.bin"), "payload");
}

TEST_F(CommandTest, CopyMissingSource)
{
    TempDir dir;
    EXPECT_THROW(copyCommand(context,
                             nlohmann::json::array({(dir.path() / "absent").string(),
                                                    (dir.path() / "dst").string()}),
                             nlohmann::json::object()),
                 std::invalid_argument);
    EXPECT_THROW(copyCommand(context, nlohmann::json::array({42}), nlohmann::json::object()),
                 std::invalid_argument);
}

TEST_F(CommandTest, CopyFailureKeepsCause)
{
    TempDir dir;
    writeFile(dir.path() / "src" / "a.txt", "alpha");
    writeFile(dir.path() / "blocker", "a file, not a directory");

    try {
        copyCommand(context,
                    nlohmann::json::array({(dir.path() / "src").string(),
                                           (dir.path() / "blocker" / "dst").string()}),
                    nlohmann::json::object());
        FAIL() << "copy into a file path succeeded";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to copy"), std::string::npos);
        EXPECT_THROW(std::rethrow_if_nested(e), std::filesystem::filesystem_error);
    }
}

TEST_F(CommandTest, CanceledCopyRemovesDestination)
{
    TempDir dir;
    writeFile(dir.path() / "src" / "a.txt", "alpha");
    writeFile(dir.path() / "src" / "b.txt", "beta");
    auto destination = dir.path() / "dst";

    requestCancel(storage, job.id);
    EXPECT_THROW(copyCommand(context,
                             nlohmann::json::array({(dir.path() / "src").string(), destination.string()}),
                             nlohmann::json::object()),
                 JobCancelled);
    EXPECT_FALSE(std::filesystem::exists(destination));
}

TEST_F(CommandTest, CanceledCopyKeepsExistingDestinationFiles)
{
    TempDir dir;
    writeFile(dir.path() / "src" / "a.txt", "alpha");
    auto destination = dir.path() / "dst";
    writeFile(destination / "keep.txt", "mine");

    requestCancel(storage, job.id);
    EXPECT_THROW(copyCommand(context,
                             nlohmann::json::array({(dir.path() / "src").string(), destination.string()}),
                             nlohmann::json::object()),
                 JobCancelled);
    EXPECT_EQ(readFile(destination / "keep.txt"), "mine");
    EXPECT_FALSE(std::filesystem::exists(destination / "a.txt"));
}

TEST(BuiltinCommands, RunThroughScheduler)
{
    MemoryStorage storage;
    Registry registry;
    registerBuiltinCommands(registry);
    EXPECT_TRUE(registry.contains("sleep"));
    EXPECT_TRUE(registry.contains("copy"));

    SchedulerConfig config;
    config.workers = 1;
    Scheduler scheduler(storage, registry, config);
    ASSERT_TRUE(scheduler.start());

    EnqueueOptions options;
    options.cancellable = true;
    options.trackProgress = true;
    auto quick = scheduler.enqueue("sleep", {0.1}, nlohmann::json::object(), options);
    ASSERT_TRUE(waitForState(scheduler, quick, State::Completed));
    EXPECT_DOUBLE_EQ(scheduler.fetchJob(quick).percentage_progress, 1.0);

    auto slow = scheduler.enqueue("sleep", {30}, nlohmann::json::object(), options);
    ASSERT_TRUE(waitForState(scheduler, slow, State::Running));
    scheduler.cancel(slow);
    ASSERT_TRUE(waitForState(scheduler, slow, State::Canceled));

    scheduler.stop();
}
