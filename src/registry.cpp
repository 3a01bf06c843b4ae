/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/registry.hpp"
#include "jobq/errors.hpp"
#include "jobq/logger.hpp"

namespace jobq {

void Registry::add(const std::string& name, JobFunction function) {
    if (name.empty() || !function) {
        throw InvalidFunctionError(name);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    functions_[name] = std::move(function);
    LOG_DEBUG("Registered job function: " + name);
}

bool Registry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return functions_.count(name) > 0;
}

JobFunction Registry::resolve(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        throw InvalidFunctionError(name);
    }
    return it->second;
}

std::vector<std::string> Registry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(functions_.size());
    for (const auto& entry : functions_) {
        out.push_back(entry.first);
    }
    return out;
}

}
