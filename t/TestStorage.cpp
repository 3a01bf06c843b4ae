/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/errors.hpp"
#include "jobq/storage.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace jobq;
using jobq::test::TempDir;
using jobq::test::seedJob;

namespace {

struct MemoryBackend {
    std::unique_ptr<Storage> open() { return std::make_unique<MemoryStorage>(); }
};

struct FileBackend {
    TempDir dir;
    std::unique_ptr<Storage> open() { return std::make_unique<FileStorage>(dir.path()); }
};

template<typename Backend>
class StorageContract : public ::testing::Test {
protected:
    Backend backend;
    std::unique_ptr<Storage> storage = backend.open();
};

using Backends = ::testing::Types<MemoryBackend, FileBackend>;
TYPED_TEST_SUITE(StorageContract, Backends);

Job
makeJob(const std::string& id)
{
    Job job;
    job.id = id;
    job.function = "noop";
    job.args = {1, "two"};
    job.kwargs = {{"three", 3}};
    return job;
}

}

TYPED_TEST(StorageContract, CreateAndGet)
{
    Job job = makeJob("job-1");
    this->storage->create(job);
    EXPECT_GT(job.sequence, 0u);

    auto stored = this->storage->get("job-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->function, "noop");
    EXPECT_EQ(stored->args, job.args);
    EXPECT_EQ(stored->kwargs, job.kwargs);
    EXPECT_EQ(stored->state, State::Scheduled);
    EXPECT_EQ(stored->sequence, job.sequence);

    EXPECT_FALSE(this->storage->get("missing").has_value());
}

TYPED_TEST(StorageContract, DuplicateIdRejected)
{
    Job job = makeJob("dup");
    this->storage->create(job);
    Job again = makeJob("dup");
    EXPECT_THROW(this->storage->create(again), StorageError);
}

TYPED_TEST(StorageContract, InvalidIdRejected)
{
    Job job = makeJob("../outside");
    EXPECT_THROW(this->storage->create(job), StorageError);
}

TYPED_TEST(StorageContract, ListIsInCreationOrder)
{
    for (const char* id : {"zeta", "alpha", "mid"}) {
        Job job = makeJob(id);
        this->storage->create(job);
    }

    auto jobs = this->storage->list();
    ASSERT_EQ(jobs.size(), 3u);
    EXPECT_EQ(jobs[0].id, "zeta");
    EXPECT_EQ(jobs[1].id, "alpha");
    EXPECT_EQ(jobs[2].id, "mid");
    EXPECT_LT(jobs[0].sequence, jobs[1].sequence);
    EXPECT_LT(jobs[1].sequence, jobs[2].sequence);
}

TYPED_TEST(StorageContract, CompareAndSet)
{
    Job job = seedJob(*this->storage, "noop", State::Queued);

    JobUpdate claim;
    claim.state = State::Running;
    claim.expected = {State::Queued};
    EXPECT_TRUE(this->storage->update(job.id, claim));
    EXPECT_FALSE(this->storage->update(job.id, claim));
    EXPECT_EQ(this->storage->get(job.id)->state, State::Running);
}

TYPED_TEST(StorageContract, UpdateUnknownJobThrows)
{
    JobUpdate update;
    update.progress = 0.5;
    EXPECT_THROW(this->storage->update("nope", update), JobNotFound);
}

TYPED_TEST(StorageContract, UpdateKeepsUnnamedFields)
{
    Job job = seedJob(*this->storage, "noop", State::Running, true, true);

    JobUpdate progress;
    progress.progress = 0.4;
    ASSERT_TRUE(this->storage->update(job.id, progress));

    JobUpdate failed;
    failed.state = State::Failed;
    failed.exception = "bad";
    failed.traceback = "trace";
    ASSERT_TRUE(this->storage->update(job.id, failed));

    auto stored = this->storage->get(job.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->state, State::Failed);
    EXPECT_DOUBLE_EQ(stored->percentage_progress, 0.4);
    EXPECT_EQ(stored->exception, "bad");
    EXPECT_EQ(stored->traceback, "trace");
    EXPECT_TRUE(stored->cancellable);
    EXPECT_TRUE(stored->track_progress);
}

TYPED_TEST(StorageContract, RemoveAndRemoveAll)
{
    Job a = seedJob(*this->storage, "noop", State::Completed);
    seedJob(*this->storage, "noop", State::Failed);
    seedJob(*this->storage, "noop", State::Queued);

    EXPECT_TRUE(this->storage->remove(a.id));
    EXPECT_FALSE(this->storage->remove(a.id));
    EXPECT_FALSE(this->storage->get(a.id).has_value());
    EXPECT_EQ(this->storage->list().size(), 2u);

    EXPECT_EQ(this->storage->removeAll(), 2u);
    EXPECT_TRUE(this->storage->list().empty());
}

TYPED_TEST(StorageContract, RemovedIdIsNeverReused)
{
    Job first = makeJob("retired");
    this->storage->create(first);
    ASSERT_TRUE(this->storage->remove("retired"));

    Job again = makeJob("retired");
    EXPECT_THROW(this->storage->create(again), StorageError);
    EXPECT_FALSE(this->storage->get("retired").has_value());

    Job other = makeJob("swept");
    this->storage->create(other);
    EXPECT_EQ(this->storage->removeAll(), 1u);
    Job sweptAgain = makeJob("swept");
    EXPECT_THROW(this->storage->create(sweptAgain), StorageError);
}

TYPED_TEST(StorageContract, ConcurrentClaimHasOneWinner)
{
    Job job = seedJob(*this->storage, "noop", State::Queued);

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            JobUpdate claim;
            claim.state = State::Running;
            claim.expected = {State::Queued};
            if (this->storage->update(job.id, claim)) {
                ++winners;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(winners.load(), 1);
}
