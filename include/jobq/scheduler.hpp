/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "jobq/config.hpp"
#include "jobq/job.hpp"
#include "jobq/pool.hpp"
#include "jobq/types.hpp"

namespace jobq {

class Registry;
class Storage;

struct EnqueueOptions {
    bool cancellable = false;
    bool trackProgress = false;
    nlohmann::json extraMetadata = nlohmann::json::object();
    // Caller-chosen id, e.g. one handed out before the request reached us.
    std::optional<JobId> jobId;
};

/**
 * Accepts jobs, persists them, runs them on the worker pool and answers
 * queries. All public methods are safe to call from any thread and none of
 * them waits for a job body.
 */
class Scheduler final {
public:
    Scheduler(Storage& storage, const Registry& registry, SchedulerConfig config = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    // The first start applies the restart policy to records left behind by
    // a previous process, then dispatches everything QUEUED.
    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    /**
     * Creates a SCHEDULED record, moves it to QUEUED and hands it to the
     * pool. Throws InvalidFunctionError for an unregistered function,
     * std::invalid_argument for malformed arguments, StorageError if the
     * record cannot be written.
     */
    JobId enqueue(const std::string& function,
                  nlohmann::json args = nlohmann::json::array(),
                  nlohmann::json kwargs = nlohmann::json::object(),
                  EnqueueOptions options = {});

    // Throws JobNotFound.
    [[nodiscard]] Job fetchJob(const JobId& id) const;
    [[nodiscard]] nlohmann::json summary(const JobId& id) const;

    // Snapshot in enqueue order.
    [[nodiscard]] std::vector<Job> jobs() const;

    /**
     * SCHEDULED/QUEUED jobs become CANCELED and never run. RUNNING jobs
     * become CANCELING; the body decides when to stop. Jobs that are not
     * cancellable, already CANCELING or terminal are left alone.
     * Throws JobNotFound.
     */
    void cancel(const JobId& id);

    // Removes a terminal job. Returns false, leaving the record, for any
    // other state. Throws JobNotFound.
    bool clearJob(const JobId& id);

    // Removes every terminal job.
    std::size_t clear();

    // cancel() on every job that is not terminal.
    void empty();

    // Hands every QUEUED job to the pool again. Safe to repeat: a job that
    // has already been claimed is skipped by the worker.
    std::size_t dispatchQueued();

    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

private:
    void recoverStaleJobs();
    void run(const JobId& id, int workerId);
    void finalize(const JobId& id, JobUpdate update) noexcept;
    void finalizeFailure(const Job& job, int workerId, const std::string& message,
                         const std::string& traceback) noexcept;

    Storage& storage_;
    const Registry& registry_;
    SchedulerConfig config_;
    Pool pool_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    bool recovered_ = false;
};

}
