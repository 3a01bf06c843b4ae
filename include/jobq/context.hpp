/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <string>

#include <nlohmann/json.hpp>

#include "jobq/types.hpp"

namespace jobq {

class Storage;
struct Job;

// Progress reporter and cancel token handed to a running job body.
// Only valid for the duration of the body call.
class JobContext {
public:
    JobContext(Storage& storage, const Job& job);

    JobContext(const JobContext&) = delete;
    JobContext& operator=(const JobContext&) = delete;

    // Clamped to [0, 1]. Never moves backwards, ignored when progress is
    // not tracked or the job is no longer RUNNING.
    void updateProgress(double fraction);
    void updateProgress(double progress, double total);

    // True once a cancel has been requested for this job. A body that sees
    // true and returns is recorded as CANCELED.
    [[nodiscard]] bool cancelRequested();

    // Throws JobCancelled if a cancel has been requested.
    void checkForCancel();

    [[nodiscard]] const JobId& jobId() const noexcept { return id_; }
    [[nodiscard]] const nlohmann::json& metadata() const noexcept { return metadata_; }
    [[nodiscard]] double progress() const noexcept { return progress_; }
    [[nodiscard]] bool cancelObserved() const noexcept { return cancelObserved_.load(); }

private:
    Storage& storage_;
    JobId id_;
    nlohmann::json metadata_;
    bool trackProgress_;
    double progress_;
    std::atomic<bool> cancelObserved_{false};
};

}
