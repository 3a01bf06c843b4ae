/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>

#include "jobq/config.hpp"
#include "jobq/registry.hpp"

namespace jobq {

class FileStorage;
class Inbox;
class Scheduler;
struct Request;

// Daemon composition: durable job store, built-in commands, scheduler and
// the loop that applies requests dropped into the workspace inbox.
class Server final {
public:
    explicit Server(const std::filesystem::path& workspace, SchedulerConfig config = SchedulerConfig::fromEnv());
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    // Register extra commands before start().
    [[nodiscard]] Registry& registry() noexcept { return registry_; }

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Applies every pending inbox request once. Returns how many were applied.
    std::size_t drainInbox();

    // Valid while running.
    [[nodiscard]] Scheduler& scheduler();
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

private:
    void scanLoop();
    bool apply(const Request& request);

    std::filesystem::path workspace_;
    SchedulerConfig config_;
    Registry registry_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<FileStorage> storage_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<Inbox> inbox_;

    std::thread scannerThread_;
};

}
