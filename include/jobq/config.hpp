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

namespace jobq {

// What start-up does with jobs a previous process left unfinished.
enum class RestartPolicy : uint8_t {
    Fail,     // SCHEDULED/QUEUED/RUNNING -> FAILED
    Requeue   // SCHEDULED/QUEUED/RUNNING -> QUEUED, run again
};

[[nodiscard]] const char* restartPolicyToString(RestartPolicy policy) noexcept;
[[nodiscard]] std::optional<RestartPolicy> restartPolicyFromString(const std::string& name) noexcept;

struct SchedulerConfig {
    int workers = 4;
    RestartPolicy restartPolicy = RestartPolicy::Fail;
    std::chrono::milliseconds scanInterval{500};

    // Defaults overridden by JOBQ_WORKERS, JOBQ_RESTART_POLICY and
    // JOBQ_SCAN_INTERVAL_MS. Invalid values are logged and ignored.
    [[nodiscard]] static SchedulerConfig fromEnv();
};

}
