/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "jobq/types.hpp"

namespace jobq {

struct Job {
    JobId id;
    std::uint64_t sequence = 0;
    std::string function;
    nlohmann::json args = nlohmann::json::array();
    nlohmann::json kwargs = nlohmann::json::object();
    State state = State::Scheduled;
    double percentage_progress = 0.0;
    bool cancellable = false;
    bool track_progress = false;
    std::string exception;
    std::string traceback;
    nlohmann::json extra_metadata = nlohmann::json::object();
    std::chrono::system_clock::time_point created_at{};

    // Observer-facing record: id, status, percentage, cancellable,
    // exception, traceback, then extra_metadata merged in verbatim.
    [[nodiscard]] nlohmann::json summary() const;
};

// A set of fields written together. When `expected` is non-empty the write
// only happens if the stored state is one of them.
struct JobUpdate {
    std::optional<State> state;
    std::optional<double> progress;
    std::optional<std::string> exception;
    std::optional<std::string> traceback;
    std::vector<State> expected;

    [[nodiscard]] bool matches(State current) const noexcept;
    void applyTo(Job& job) const;
};

// Placeholder summary for a job that does not exist (yet).
[[nodiscard]] nlohmann::json emptySummary();

[[nodiscard]] nlohmann::json toJson(const Job& job);
[[nodiscard]] Job fromJson(const nlohmann::json& json);

[[nodiscard]] JobId generateJobId();

// Ids double as file names: non-empty, [A-Za-z0-9_.-], no leading dot.
[[nodiscard]] bool isValidJobId(const JobId& id) noexcept;

}
