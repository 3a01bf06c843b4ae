/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/storage.hpp"
#include "jobq/errors.hpp"
#include "jobq/logger.hpp"
#include <algorithm>
#include <fstream>

namespace jobq {

namespace {
constexpr const char* kRecordExtension = ".json";
}

FileStorage::FileStorage(const std::filesystem::path& workspace, bool readOnly)
    : workspace_(workspace),
      readOnly_(readOnly),
      jobsPath_(workspace / "jobs"),
      writingPath_(workspace / "writing"),
      clearedPath_(workspace / "cleared") {
    if (readOnly_) {
        std::error_code ec;
        if (!std::filesystem::is_directory(jobsPath_, ec)) {
            throw StorageError("No job store in " + workspace_.string());
        }
    } else {
        createDirectories();
        discardPartialWrites();
    }
    loadSequence();
    LOG_DEBUG("FileStorage opened: " + workspace_.string() +
              " (next sequence " + std::to_string(nextSequence_) + ")");
}

void FileStorage::create(Job& job) {
    requireWritable("create");
    std::lock_guard<std::mutex> lock(mutex_);

    if (!isValidJobId(job.id)) {
        throw StorageError("Invalid job id: '" + job.id + "'");
    }

    auto finalPath = recordPath(job.id);
    std::error_code ec;
    if (std::filesystem::exists(finalPath, ec) || std::filesystem::exists(clearedPath_ / job.id, ec)) {
        throw StorageError("Duplicate job id: " + job.id);
    }

    job.sequence = nextSequence_;
    auto stagingPath = writingPath_ / (job.id + kRecordExtension);
    try {
        writeRecord(stagingPath, job);
    } catch (...) {
        std::filesystem::remove(stagingPath, ec);
        throw;
    }

    // Publish
    std::filesystem::rename(stagingPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(stagingPath, ignored);
        throw StorageError("Failed to publish job " + job.id + ": " + ec.message());
    }
    ++nextSequence_;
    LOG_TRACE("Record created: " + job.id);
}

bool FileStorage::update(const JobId& id, const JobUpdate& update) {
    requireWritable("update");
    std::lock_guard<std::mutex> lock(mutex_);

    if (!isValidJobId(id)) {
        throw JobNotFound(id);
    }
    auto path = recordPath(id);
    auto job = readRecord(path);
    if (!job) {
        throw JobNotFound(id);
    }
    if (!update.matches(job->state)) {
        return false;
    }
    update.applyTo(*job);
    writeRecord(path, *job);
    return true;
}

std::optional<Job> FileStorage::get(const JobId& id) const {
    if (!isValidJobId(id)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return readRecord(recordPath(id));
}

std::vector<Job> FileStorage::list() const {
    std::vector<Job> jobs;
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(jobsPath_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kRecordExtension) {
            continue;
        }
        try {
            if (auto job = readRecord(entry.path())) {
                jobs.push_back(std::move(*job));
            }
        } catch (const StorageError& e) {
            LOG_ERROR("Skipping unreadable record " + entry.path().string() + ": " + e.what());
        }
    }
    if (ec) {
        throw StorageError("Failed to list " + jobsPath_.string() + ": " + ec.message());
    }

    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        return a.sequence < b.sequence;
    });
    return jobs;
}

bool FileStorage::remove(const JobId& id) {
    requireWritable("remove");
    if (!isValidJobId(id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = recordPath(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    // Marker first: a crash in between still leaves the id taken
    retire(id);
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        throw StorageError("Failed to remove job " + id + ": " + ec.message());
    }
    return removed;
}

std::size_t FileStorage::removeAll() {
    requireWritable("removeAll");
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;

    std::error_code ec;
    std::vector<std::filesystem::path> records;
    for (const auto& entry : std::filesystem::directory_iterator(jobsPath_, ec)) {
        if (entry.path().extension() == kRecordExtension) {
            records.push_back(entry.path());
        }
    }
    if (ec) {
        throw StorageError("Failed to list " + jobsPath_.string() + ": " + ec.message());
    }

    for (const auto& path : records) {
        retire(path.stem().string());
        if (std::filesystem::remove(path, ec)) {
            ++count;
        } else if (ec) {
            LOG_ERROR("Failed to remove " + path.string() + ": " + ec.message());
        }
    }
    return count;
}

void FileStorage::createDirectories() {
    try {
        std::filesystem::create_directories(jobsPath_);
        std::filesystem::create_directories(writingPath_);
        std::filesystem::create_directories(clearedPath_);
    } catch (const std::filesystem::filesystem_error& e) {
        throw StorageError("Failed to create job store in " + workspace_.string() + ": " + e.what());
    }
}

void FileStorage::requireWritable(const char* operation) const {
    if (readOnly_) {
        throw StorageError(std::string(operation) + " on read-only job store " + workspace_.string());
    }
}

// Anything in writing/ or a stray .tmp was never published.
void FileStorage::discardPartialWrites() noexcept {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(writingPath_, ec)) {
        LOG_WARN("Discarding unpublished record: " + entry.path().filename().string());
        std::error_code ignored;
        std::filesystem::remove_all(entry.path(), ignored);
    }
    for (const auto& entry : std::filesystem::directory_iterator(jobsPath_, ec)) {
        if (entry.path().extension() == ".tmp") {
            std::error_code ignored;
            std::filesystem::remove(entry.path(), ignored);
        }
    }
}

void FileStorage::loadSequence() {
    std::uint64_t highest = 0;
    for (const auto& job : list()) {
        highest = std::max(highest, job.sequence);
    }
    nextSequence_ = highest + 1;
}

std::filesystem::path FileStorage::recordPath(const JobId& id) const {
    return jobsPath_ / (id + kRecordExtension);
}

void FileStorage::retire(const JobId& id) {
    std::ofstream marker(clearedPath_ / id, std::ios::binary | std::ios::trunc);
    if (!marker) {
        throw StorageError("Failed to retire job id " + id + " in " + clearedPath_.string());
    }
}

std::optional<Job> FileStorage::readRecord(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::nullopt;
        }
        throw StorageError("Failed to open record " + path.string());
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Corrupt record " + path.string() + ": " + e.what());
    }
    return fromJson(json);
}

void FileStorage::writeRecord(const std::filesystem::path& path, const Job& job) const {
    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw StorageError("Failed to open " + tempPath.string() + " for writing");
        }
        file << toJson(job).dump();
        file.flush();
        if (!file.good()) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            throw StorageError("Failed to write record " + tempPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        throw StorageError("Failed to commit record " + path.string() + ": " + ec.message());
    }
}

}
