/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <vector>

using namespace jobq;
using jobq::test::Gate;
using jobq::test::waitFor;

TEST(Pool, RunsEverySubmittedJob)
{
    Pool pool(4);
    std::mutex mutex;
    std::multiset<JobId> seen;
    ASSERT_TRUE(pool.start([&](const JobId& id, int) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(id);
    }));

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.submit("job-" + std::to_string(i)));
    }
    ASSERT_TRUE(waitFor([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size() == 100;
    }));
    pool.stop();

    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(seen.count("job-" + std::to_string(i)), 1u);
    }
}

TEST(Pool, SingleWorkerKeepsSubmissionOrder)
{
    Pool pool(1);
    std::mutex mutex;
    std::vector<JobId> order;
    ASSERT_TRUE(pool.start([&](const JobId& id, int workerId) {
        EXPECT_EQ(workerId, 0);
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(id);
    }));

    for (const char* id : {"a", "b", "c", "d"}) {
        ASSERT_TRUE(pool.submit(id));
    }
    ASSERT_TRUE(waitFor([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 4;
    }));
    pool.stop();

    EXPECT_EQ(order, (std::vector<JobId>{"a", "b", "c", "d"}));
}

TEST(Pool, SubmitToStoppedPoolFails)
{
    Pool pool(2);
    EXPECT_FALSE(pool.submit("early"));

    ASSERT_TRUE(pool.start([](const JobId&, int) {}));
    EXPECT_FALSE(pool.start([](const JobId&, int) {}));
    pool.stop();

    EXPECT_FALSE(pool.isRunning());
    EXPECT_FALSE(pool.submit("late"));
}

TEST(Pool, WorkerSurvivesThrowingProcessor)
{
    Pool pool(1);
    std::atomic<int> processed{0};
    ASSERT_TRUE(pool.start([&](const JobId& id, int) {
        ++processed;
        if (id == "bad") {
            throw std::runtime_error("processor failure");
        }
    }));

    ASSERT_TRUE(pool.submit("bad"));
    ASSERT_TRUE(pool.submit("good"));
    EXPECT_TRUE(waitFor([&] { return processed.load() == 2; }));
    pool.stop();
}

TEST(Pool, StopDropsQueuedIdsAfterCurrentJob)
{
    Pool pool(1);
    Gate entered;
    Gate release;
    std::atomic<int> processed{0};
    ASSERT_TRUE(pool.start([&](const JobId&, int) {
        entered.open();
        release.wait();
        ++processed;
    }));

    ASSERT_TRUE(pool.submit("running"));
    ASSERT_TRUE(entered.wait());
    ASSERT_TRUE(pool.submit("waiting"));
    EXPECT_EQ(pool.queueSize(), 1u);
    EXPECT_EQ(pool.busyCount(), 1);

    std::thread stopper([&] { pool.stop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.open();
    stopper.join();

    EXPECT_EQ(processed.load(), 1);
    EXPECT_EQ(pool.queueSize(), 0u);
}
