/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "jobq/job.hpp"

namespace jobq {

// Table of job records. Every write is atomic with respect to other
// writes on the same store.
class Storage {
public:
    virtual ~Storage() = default;

    // Assigns job.sequence. Throws StorageError on a duplicate id, including
    // the id of a record that has since been removed.
    virtual void create(Job& job) = 0;

    // Returns false, writing nothing, when update.expected does not match
    // the stored state. Throws JobNotFound for an unknown id.
    virtual bool update(const JobId& id, const JobUpdate& update) = 0;

    [[nodiscard]] virtual std::optional<Job> get(const JobId& id) const = 0;

    // All records in creation order.
    [[nodiscard]] virtual std::vector<Job> list() const = 0;

    virtual bool remove(const JobId& id) = 0;
    virtual std::size_t removeAll() = 0;
};

class MemoryStorage final : public Storage {
public:
    MemoryStorage() = default;

    MemoryStorage(const MemoryStorage&) = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

    void create(Job& job) override;
    bool update(const JobId& id, const JobUpdate& update) override;
    [[nodiscard]] std::optional<Job> get(const JobId& id) const override;
    [[nodiscard]] std::vector<Job> list() const override;
    bool remove(const JobId& id) override;
    std::size_t removeAll() override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<JobId, Job> jobs_;
    std::unordered_set<JobId> retired_;
    std::uint64_t nextSequence_ = 1;
};

// One JSON file per job under <workspace>/jobs, published by rename so
// readers in other processes never see a partial record. Removing a record
// leaves an empty marker in <workspace>/cleared so its id stays taken. A read-only store
// leaves the directory untouched and refuses writes; it is how tools look at
// a workspace owned by a running daemon.
class FileStorage final : public Storage {
public:
    explicit FileStorage(const std::filesystem::path& workspace, bool readOnly = false);

    FileStorage(const FileStorage&) = delete;
    FileStorage& operator=(const FileStorage&) = delete;

    void create(Job& job) override;
    bool update(const JobId& id, const JobUpdate& update) override;
    [[nodiscard]] std::optional<Job> get(const JobId& id) const override;
    [[nodiscard]] std::vector<Job> list() const override;
    bool remove(const JobId& id) override;
    std::size_t removeAll() override;

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] bool readOnly() const noexcept { return readOnly_; }

private:
    std::filesystem::path workspace_;
    bool readOnly_;
    std::filesystem::path jobsPath_;
    std::filesystem::path writingPath_;
    std::filesystem::path clearedPath_;

    mutable std::mutex mutex_;
    std::uint64_t nextSequence_ = 1;

    void createDirectories();
    void requireWritable(const char* operation) const;
    void discardPartialWrites() noexcept;
    void loadSequence();

    [[nodiscard]] std::filesystem::path recordPath(const JobId& id) const;
    void retire(const JobId& id);
    [[nodiscard]] std::optional<Job> readRecord(const std::filesystem::path& path) const;
    void writeRecord(const std::filesystem::path& path, const Job& job) const;
};

}
