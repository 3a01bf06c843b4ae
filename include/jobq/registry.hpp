/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace jobq {

class JobContext;

// Job body. Signals failure by throwing; honours cancellation through the
// context.
using JobFunction = std::function<void(JobContext& context,
                                       const nlohmann::json& args,
                                       const nlohmann::json& kwargs)>;

// Maps stable command names to job bodies. Populated at startup, read by
// the scheduler from any thread.
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Replaces an existing entry of the same name.
    void add(const std::string& name, JobFunction function);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] JobFunction resolve(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, JobFunction> functions_;
};

}
