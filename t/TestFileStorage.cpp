/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/errors.hpp"
#include "jobq/storage.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace jobq;
using jobq::test::TempDir;
using jobq::test::seedJob;

TEST(FileStorage, RecordsSurviveReopen)
{
    TempDir dir;
    JobId id;
    {
        FileStorage storage(dir.path());
        Job job = seedJob(storage, "copy", State::Running, true, true);
        id = job.id;

        JobUpdate progress;
        progress.progress = 0.75;
        ASSERT_TRUE(storage.update(id, progress));
    }

    FileStorage reopened(dir.path());
    auto job = reopened.get(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->function, "copy");
    EXPECT_EQ(job->state, State::Running);
    EXPECT_DOUBLE_EQ(job->percentage_progress, 0.75);
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "jobs" / (id + ".json")));
}

TEST(FileStorage, SequenceContinuesAfterReopen)
{
    TempDir dir;
    std::uint64_t last = 0;
    {
        FileStorage storage(dir.path());
        last = seedJob(storage, "a", State::Scheduled).sequence;
        last = seedJob(storage, "b", State::Scheduled).sequence;
    }

    FileStorage reopened(dir.path());
    Job next = seedJob(reopened, "c", State::Scheduled);
    EXPECT_GT(next.sequence, last);

    auto jobs = reopened.list();
    ASSERT_EQ(jobs.size(), 3u);
    EXPECT_EQ(jobs.back().function, "c");
}

TEST(FileStorage, DiscardsUnpublishedWrites)
{
    TempDir dir;
    JobId id;
    {
        FileStorage storage(dir.path());
        id = seedJob(storage, "a", State::Queued).id;
    }
    std::ofstream(dir.path() / "writing" / "half.json") << "{\"id\":";
    std::ofstream(dir.path() / "jobs" / (id + ".json.tmp")) << "{";

    FileStorage reopened(dir.path());
    EXPECT_TRUE(std::filesystem::is_empty(dir.path() / "writing"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "jobs" / (id + ".json.tmp")));
    EXPECT_EQ(reopened.list().size(), 1u);
}

TEST(FileStorage, CorruptRecordIsSkippedByList)
{
    TempDir dir;
    FileStorage storage(dir.path());
    Job good = seedJob(storage, "a", State::Completed);
    std::ofstream(dir.path() / "jobs" / "broken.json") << "not json";

    auto jobs = storage.list();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].id, good.id);
    EXPECT_THROW((void)storage.get("broken"), StorageError);
}

TEST(FileStorage, RemovedIdStaysTakenAfterReopen)
{
    TempDir dir;
    JobId id;
    {
        FileStorage storage(dir.path());
        id = seedJob(storage, "a", State::Completed).id;
        ASSERT_TRUE(storage.remove(id));
    }
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "cleared" / id));

    FileStorage reopened(dir.path());
    Job job;
    job.id = id;
    job.function = "a";
    EXPECT_THROW(reopened.create(job), StorageError);
    EXPECT_TRUE(reopened.list().empty());
}

TEST(FileStorage, ReadOnlyStore)
{
    TempDir dir;
    EXPECT_THROW(FileStorage(dir.path(), true), StorageError);

    JobId id;
    {
        FileStorage storage(dir.path());
        id = seedJob(storage, "a", State::Queued).id;
    }
    std::ofstream(dir.path() / "writing" / "inflight.json") << "{";

    FileStorage reader(dir.path(), true);
    EXPECT_TRUE(reader.readOnly());
    EXPECT_EQ(reader.list().size(), 1u);
    ASSERT_TRUE(reader.get(id).has_value());

    // Another process may own writing/; a reader leaves it alone
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "writing" / "inflight.json"));

    Job job;
    job.id = "new";
    job.function = "a";
    EXPECT_THROW(reader.create(job), StorageError);
    JobUpdate update;
    update.state = State::Canceled;
    EXPECT_THROW(reader.update(id, update), StorageError);
    EXPECT_THROW(reader.remove(id), StorageError);
    EXPECT_THROW(reader.removeAll(), StorageError);
}
