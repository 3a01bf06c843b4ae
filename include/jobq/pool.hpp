/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "jobq/types.hpp"

namespace jobq {

using JobProcessor = std::function<void(const JobId&, int workerId)>;

// Fixed set of worker threads taking job ids in submission order. The
// processor decides whether a popped id still needs to run.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);

    // Joins the workers after their current job. Ids still queued are
    // dropped; they remain QUEUED in storage.
    void stop() noexcept;

    [[nodiscard]] bool submit(const JobId& jobId) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }
    [[nodiscard]] int busyCount() const noexcept { return busy_.load(); }

private:
    void workerLoop(int workerId);

    int workers_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> busy_{0};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::deque<JobId> jobQueue_;

    std::vector<std::thread> workerThreads_;
};

}
