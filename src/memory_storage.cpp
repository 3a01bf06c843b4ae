/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/storage.hpp"
#include "jobq/errors.hpp"
#include <algorithm>

namespace jobq {

void MemoryStorage::create(Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isValidJobId(job.id)) {
        throw StorageError("Invalid job id: '" + job.id + "'");
    }
    if (jobs_.count(job.id) > 0 || retired_.count(job.id) > 0) {
        throw StorageError("Duplicate job id: " + job.id);
    }
    job.sequence = nextSequence_++;
    jobs_.emplace(job.id, job);
}

bool MemoryStorage::update(const JobId& id, const JobUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw JobNotFound(id);
    }
    if (!update.matches(it->second.state)) {
        return false;
    }
    update.applyTo(it->second);
    return true;
}

std::optional<Job> MemoryStorage::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Job> MemoryStorage::list() const {
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.reserve(jobs_.size());
        for (const auto& entry : jobs_) {
            jobs.push_back(entry.second);
        }
    }
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        return a.sequence < b.sequence;
    });
    return jobs;
}

bool MemoryStorage::remove(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.erase(id) == 0) {
        return false;
    }
    retired_.insert(id);
    return true;
}

std::size_t MemoryStorage::removeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = jobs_.size();
    for (const auto& entry : jobs_) {
        retired_.insert(entry.first);
    }
    jobs_.clear();
    return count;
}

}
