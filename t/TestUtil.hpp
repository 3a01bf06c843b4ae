/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "jobq/job.hpp"
#include "jobq/scheduler.hpp"
#include "jobq/storage.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <ostream>
#include <random>
#include <string>
#include <thread>

namespace jobq {

// Readable states in gtest failure output
inline void PrintTo(State state, std::ostream* os) {
    *os << stateToString(state);
}

}

namespace jobq::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("jobq-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// One-shot signal between a test and a job body.
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    bool wait(std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

inline bool waitForState(const Scheduler& scheduler, const JobId& id, State state,
                         std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    return waitFor([&] { return scheduler.fetchJob(id).state == state; }, timeout);
}

inline bool waitForTerminal(const Storage& storage, const JobId& id,
                            std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    return waitFor([&] {
        auto job = storage.get(id);
        return job && isTerminal(job->state);
    }, timeout);
}

// Creates a record directly in the given state, bypassing the scheduler.
inline Job seedJob(Storage& storage, const std::string& function, State state,
                   bool cancellable = false, bool trackProgress = false) {
    Job job;
    job.id = generateJobId();
    job.function = function;
    job.cancellable = cancellable;
    job.track_progress = trackProgress;
    job.created_at = std::chrono::system_clock::now();
    storage.create(job);
    if (state != State::Scheduled) {
        JobUpdate update;
        update.state = state;
        storage.update(job.id, update);
        job.state = state;
    }
    return job;
}

}
