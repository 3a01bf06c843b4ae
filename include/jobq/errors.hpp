/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>

#include "jobq/types.hpp"

namespace jobq {

class JobNotFound : public std::runtime_error {
public:
    explicit JobNotFound(const JobId& id)
        : std::runtime_error("Job not found: " + id), id_(id) {}

    [[nodiscard]] const JobId& id() const noexcept { return id_; }

private:
    JobId id_;
};

class InvalidFunctionError : public std::runtime_error {
public:
    explicit InvalidFunctionError(const std::string& name)
        : std::runtime_error("Unknown job function: " + name), name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by JobContext::checkForCancel(). Only the scheduler's execution
// wrapper catches it; a body may catch it to clean up but must rethrow.
class JobCancelled : public std::runtime_error {
public:
    JobCancelled() : std::runtime_error("Job cancelled") {}
};

} // namespace jobq
