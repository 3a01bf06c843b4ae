/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/server.hpp"
#include "jobq/commands.hpp"
#include "jobq/errors.hpp"
#include "jobq/inbox.hpp"
#include "jobq/logger.hpp"
#include "jobq/scheduler.hpp"
#include "jobq/storage.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

namespace jobq {

// Signal handling is done by the daemon executable, not here

Server::Server(const std::filesystem::path& workspace, SchedulerConfig config)
    : workspace_(workspace), config_(config) {
    registerBuiltinCommands(registry_);
    LOG_DEBUG("Server created - workspace: " + workspace_.string() +
              ", workers: " + std::to_string(config_.workers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting jobq server...");
    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + workspace_.string());
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));
    LOG_DEBUG("Restart policy: " + std::string(restartPolicyToString(config_.restartPolicy)));
    LOG_DEBUG("Scan interval: " + std::to_string(config_.scanInterval.count()) + "ms");
    LOG_DEBUG("========================================");

    try {
        storage_ = std::make_unique<FileStorage>(workspace_);
        inbox_ = std::make_unique<Inbox>(workspace_, true);
        if (!inbox_->isReady()) {
            LOG_ERROR("Request inbox unavailable");
            return false;
        }
        scheduler_ = std::make_unique<Scheduler>(*storage_, registry_, config_);

        // Applies the restart policy to whatever the last process left behind
        if (!scheduler_->start()) {
            LOG_ERROR("Failed to start scheduler");
            scheduler_.reset();
            return false;
        }

        shutdown_.store(false);
        running_.store(true);
        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_INFO("Server started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        scheduler_.reset();
        inbox_.reset();
        storage_.reset();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }

    if (scheduler_) {
        scheduler_->stop();
    }

    scheduler_.reset();
    inbox_.reset();
    storage_.reset();

    LOG_INFO("Server shutdown complete");
}

Scheduler& Server::scheduler() {
    if (!scheduler_) {
        throw std::logic_error("Server is not running");
    }
    return *scheduler_;
}

std::size_t Server::drainInbox() {
    if (!inbox_ || !scheduler_) {
        return 0;
    }

    std::size_t applied = 0;
    for (const auto& path : inbox_->scan()) {
        if (shutdown_.load()) {
            break;
        }
        auto request = inbox_->take(path);
        if (request && apply(*request)) {
            ++applied;
        }
    }
    return applied;
}

bool Server::apply(const Request& request) {
    try {
        switch (request.kind) {
            case RequestKind::Submit: {
                EnqueueOptions options;
                options.cancellable = request.cancellable;
                options.trackProgress = request.trackProgress;
                options.extraMetadata = request.extraMetadata;
                options.jobId = request.jobId;
                (void)scheduler_->enqueue(request.function, request.args, request.kwargs, std::move(options));
                return true;
            }
            case RequestKind::Cancel:
                scheduler_->cancel(request.jobId);
                return true;
            case RequestKind::Clear:
                (void)scheduler_->clearJob(request.jobId);
                return true;
            case RequestKind::ClearAll:
                (void)scheduler_->clear();
                return true;
            case RequestKind::Empty:
                scheduler_->empty();
                return true;
        }
    } catch (const JobNotFound& e) {
        LOG_WARN(std::string(requestKindToString(request.kind)) + " request ignored: " + e.what());
    } catch (const InvalidFunctionError& e) {
        LOG_ERROR("Submit request rejected: " + std::string(e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string(requestKindToString(request.kind)) + " request for '" + request.jobId +
                  "' failed: " + e.what());
    }
    return false;
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    while (!shutdown_.load()) {
        try {
            std::size_t applied = drainInbox();
            if (applied > 0) {
                LOG_DEBUG("Applied " + std::to_string(applied) + " request(s)");
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
        }

        auto sleepEnd = std::chrono::steady_clock::now() + config_.scanInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    LOG_DEBUG("Scanner loop stopped");
    clearThreadName();
}

}
