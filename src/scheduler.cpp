/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/scheduler.hpp"
#include "jobq/context.hpp"
#include "jobq/errors.hpp"
#include "jobq/logger.hpp"
#include "jobq/registry.hpp"
#include "jobq/storage.hpp"
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <typeinfo>
#include <cxxabi.h>

namespace jobq {

namespace {
constexpr const char* kRestartMessage = "Job interrupted by process restart";

std::string demangle(const char* name) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    return status == 0 && demangled ? std::string(demangled.get()) : std::string(name);
}

void appendExceptionChain(std::ostringstream& out, const std::exception& e, int depth) {
    out << "  #" << depth << " " << demangle(typeid(e).name()) << ": " << e.what() << "\n";
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        appendExceptionChain(out, nested, depth + 1);
    } catch (...) {
        out << "  #" << depth + 1 << " non-standard exception\n";
    }
}

std::string tracebackHeader(const Job& job, int workerId, double elapsed) {
    std::ostringstream out;
    out << "Traceback (job " << job.id << ", function " << job.function
        << ", worker " << workerId << ", after " << std::fixed << std::setprecision(3)
        << elapsed << "s):\n";
    out << "  args: " << job.args.dump() << "\n";
    out << "  kwargs: " << job.kwargs.dump() << "\n";
    return out.str();
}

std::string exceptionMessage(const std::exception& e) {
    std::string message = e.what();
    return message.empty() ? demangle(typeid(e).name()) : message;
}
}

Scheduler::Scheduler(Storage& storage, const Registry& registry, SchedulerConfig config)
    : storage_(storage), registry_(registry), config_(config), pool_(config.workers) {
    LOG_DEBUG("Scheduler created - workers: " + std::to_string(pool_.workerCount()) +
              ", restart policy: " + restartPolicyToString(config_.restartPolicy));
}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_.load()) {
        LOG_WARN("Scheduler already running");
        return false;
    }

    try {
        if (!recovered_) {
            recoverStaleJobs();
            recovered_ = true;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to recover jobs from previous run: " + std::string(e.what()));
        return false;
    }

    if (!pool_.start([this](const JobId& id, int workerId) { run(id, workerId); })) {
        LOG_ERROR("Failed to start worker pool");
        return false;
    }
    running_.store(true);

    try {
        std::size_t dispatched = dispatchQueued();
        if (dispatched > 0) {
            LOG_INFO("Dispatched " + std::to_string(dispatched) + " queued job(s)");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to dispatch queued jobs: " + std::string(e.what()));
    }

    LOG_INFO("Scheduler started");
    return true;
}

void Scheduler::stop() noexcept {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_.load()) {
        return;
    }
    LOG_INFO("Stopping scheduler...");
    running_.store(false);
    pool_.stop();
    LOG_INFO("Scheduler stopped");
}

JobId Scheduler::enqueue(const std::string& function, nlohmann::json args,
                         nlohmann::json kwargs, EnqueueOptions options) {
    if (!registry_.contains(function)) {
        LOG_WARN("Rejected job for unknown function: " + function);
        throw InvalidFunctionError(function);
    }

    if (args.is_null()) args = nlohmann::json::array();
    if (kwargs.is_null()) kwargs = nlohmann::json::object();
    if (options.extraMetadata.is_null()) options.extraMetadata = nlohmann::json::object();
    if (!args.is_array()) {
        throw std::invalid_argument("Job args must be a JSON array");
    }
    if (!kwargs.is_object()) {
        throw std::invalid_argument("Job kwargs must be a JSON object");
    }
    if (!options.extraMetadata.is_object()) {
        throw std::invalid_argument("Job extra_metadata must be a JSON object");
    }

    Job job;
    job.id = options.jobId ? *options.jobId : generateJobId();
    job.function = function;
    job.args = std::move(args);
    job.kwargs = std::move(kwargs);
    job.state = State::Scheduled;
    job.cancellable = options.cancellable;
    job.track_progress = options.trackProgress;
    job.extra_metadata = std::move(options.extraMetadata);
    job.created_at = std::chrono::system_clock::now();

    storage_.create(job);

    JobUpdate queued;
    queued.state = State::Queued;
    queued.expected = {State::Scheduled};
    bool handedOff = false;
    try {
        handedOff = storage_.update(job.id, queued);
    } catch (const StorageError& e) {
        LOG_ERROR("Failed to queue job " + job.id + ": " + e.what());
        try {
            (void)storage_.remove(job.id);
        } catch (const StorageError& cleanup) {
            LOG_ERROR("Failed to remove unqueued job " + job.id + ": " + cleanup.what());
        }
        throw;
    }

    if (handedOff && running_.load()) {
        (void)pool_.submit(job.id);
    }

    LOG_INFO("Job enqueued: " + job.id + " (" + function + ")");
    return job.id;
}

Job Scheduler::fetchJob(const JobId& id) const {
    auto job = storage_.get(id);
    if (!job) {
        throw JobNotFound(id);
    }
    return std::move(*job);
}

nlohmann::json Scheduler::summary(const JobId& id) const {
    return fetchJob(id).summary();
}

std::vector<Job> Scheduler::jobs() const {
    return storage_.list();
}

void Scheduler::cancel(const JobId& id) {
    // Each failed compare-and-set means the job moved forward; states only
    // move forward, so this settles within a few rounds.
    while (true) {
        Job job = fetchJob(id);

        if (!job.cancellable) {
            LOG_DEBUG("Ignoring cancel of non-cancellable job " + id);
            return;
        }

        JobUpdate update;
        switch (job.state) {
            case State::Scheduled:
            case State::Queued:
                update.state = State::Canceled;
                update.expected = {State::Scheduled, State::Queued};
                if (storage_.update(id, update)) {
                    LOG_INFO("Job canceled before running: " + id);
                    return;
                }
                break;

            case State::Running:
                update.state = State::Canceling;
                update.expected = {State::Running};
                if (storage_.update(id, update)) {
                    LOG_INFO("Cancel requested for running job: " + id);
                    return;
                }
                break;

            default:
                LOG_DEBUG("Cancel of job " + id + " in state " + stateToString(job.state) + " is a no-op");
                return;
        }
    }
}

bool Scheduler::clearJob(const JobId& id) {
    Job job = fetchJob(id);
    if (!isTerminal(job.state)) {
        LOG_DEBUG("Not clearing job " + id + " in state " + stateToString(job.state));
        return false;
    }
    bool removed = storage_.remove(id);
    if (removed) {
        LOG_INFO("Job cleared: " + id);
    }
    return removed;
}

std::size_t Scheduler::clear() {
    std::size_t removed = 0;
    for (const auto& job : storage_.list()) {
        if (isTerminal(job.state) && storage_.remove(job.id)) {
            ++removed;
        }
    }
    LOG_INFO("Cleared " + std::to_string(removed) + " finished job(s)");
    return removed;
}

void Scheduler::empty() {
    for (const auto& job : storage_.list()) {
        if (isTerminal(job.state)) {
            continue;
        }
        try {
            cancel(job.id);
        } catch (const JobNotFound&) {
            LOG_DEBUG("Job vanished while emptying queue: " + job.id);
        }
    }
}

std::size_t Scheduler::dispatchQueued() {
    if (!running_.load()) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto& job : storage_.list()) {
        if (job.state == State::Queued && pool_.submit(job.id)) {
            ++count;
        }
    }
    return count;
}

void Scheduler::recoverStaleJobs() {
    int recovered = 0;
    for (const auto& job : storage_.list()) {
        JobUpdate update;
        update.expected = {job.state};

        switch (job.state) {
            case State::Scheduled:
            case State::Queued:
            case State::Running:
                if (config_.restartPolicy == RestartPolicy::Requeue) {
                    update.state = State::Queued;
                    update.progress = 0.0;
                    LOG_WARN("Requeueing job left " + std::string(stateToString(job.state)) + ": " + job.id);
                } else {
                    update.state = State::Failed;
                    update.exception = kRestartMessage;
                    update.traceback = std::string("State at restart: ") + stateToString(job.state);
                    LOG_WARN("Failing job left " + std::string(stateToString(job.state)) + ": " + job.id);
                }
                break;

            case State::Canceling:
                update.state = State::Canceled;
                LOG_WARN("Completing cancel of job left CANCELING: " + job.id);
                break;

            default:
                continue;
        }

        if (storage_.update(job.id, update)) {
            ++recovered;
        }
    }

    if (recovered > 0) {
        LOG_INFO("Recovered " + std::to_string(recovered) + " job(s) from previous run");
    }
}

void Scheduler::run(const JobId& id, int workerId) {
    JobUpdate claim;
    claim.state = State::Running;
    claim.expected = {State::Queued};

    try {
        if (!storage_.update(id, claim)) {
            LOG_DEBUG("Job no longer queued, skipping: " + id);
            return;
        }
    } catch (const JobNotFound&) {
        LOG_DEBUG("Job removed before it ran: " + id);
        return;
    } catch (const StorageError& e) {
        LOG_ERROR("Failed to claim job " + id + ": " + e.what());
        return;
    }

    std::optional<Job> job;
    try {
        job = storage_.get(id);
    } catch (const StorageError& e) {
        LOG_ERROR("Failed to load claimed job " + id + ": " + e.what());
    }
    if (!job) {
        JobUpdate failed;
        failed.state = State::Failed;
        failed.exception = "Job record could not be loaded after claim";
        finalize(id, failed);
        return;
    }

    LOG_INFO("Running job " + id + " (" + job->function + ")");
    auto startTime = std::chrono::steady_clock::now();
    auto elapsed = [&startTime] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    };

    JobFunction body;
    try {
        body = registry_.resolve(job->function);
    } catch (const InvalidFunctionError& e) {
        finalizeFailure(*job, workerId, e.what(), tracebackHeader(*job, workerId, 0.0));
        return;
    }

    JobContext context(storage_, *job);
    try {
        body(context, job->args, job->kwargs);
    } catch (const JobCancelled&) {
        JobUpdate canceled;
        canceled.state = State::Canceled;
        finalize(id, canceled);
        LOG_INFO("Job canceled: " + id);
        return;
    } catch (const std::exception& e) {
        std::ostringstream traceback;
        traceback << tracebackHeader(*job, workerId, elapsed());
        appendExceptionChain(traceback, e, 0);
        finalizeFailure(*job, workerId, exceptionMessage(e), traceback.str());
        return;
    } catch (...) {
        finalizeFailure(*job, workerId, "Unknown error",
                        tracebackHeader(*job, workerId, elapsed()) + "  #0 non-standard exception\n");
        return;
    }

    JobUpdate done;
    if (context.cancelObserved()) {
        done.state = State::Canceled;
        LOG_INFO("Job canceled: " + id);
    } else {
        done.state = State::Completed;
        if (job->track_progress) {
            done.progress = 1.0;
        }
        std::ostringstream took;
        took << std::fixed << std::setprecision(1) << elapsed();
        LOG_INFO("Job completed: " + id + " in " + took.str() + "s");
    }
    finalize(id, done);
}

void Scheduler::finalize(const JobId& id, JobUpdate update) noexcept {
    update.expected = {State::Running, State::Canceling};
    try {
        if (!storage_.update(id, update)) {
            LOG_WARN("Job " + id + " left RUNNING/CANCELING before it could be finalized");
        }
        return;
    } catch (const JobNotFound&) {
        LOG_WARN("Job removed while running: " + id);
        return;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record final state of job " + id + ": " + e.what());
    }

    // The intended state could not be written; try to at least mark it failed
    try {
        JobUpdate failed;
        failed.state = State::Failed;
        failed.exception = "Failed to record final job state";
        failed.expected = update.expected;
        (void)storage_.update(id, failed);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to mark job " + id + " as failed: " + e.what());
    }
}

void Scheduler::finalizeFailure(const Job& job, int workerId, const std::string& message,
                                const std::string& traceback) noexcept {
    LOG_WARN("Job failed on Worker-" + std::to_string(workerId) + ": " + job.id + " - " + message);
    try {
        JobUpdate failed;
        failed.state = State::Failed;
        failed.exception = message;
        failed.traceback = traceback;
        finalize(job.id, std::move(failed));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to build failure record for job " + job.id + ": " + e.what());
    }
}

}
