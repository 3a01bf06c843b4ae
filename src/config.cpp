/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/config.hpp"
#include "jobq/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace jobq {

namespace {
std::optional<long long> env_positive(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(val, &consumed);
        if (consumed != std::string(val).size() || parsed <= 0) {
            throw std::invalid_argument(val);
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return std::nullopt;
    }
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

const char* restartPolicyToString(RestartPolicy policy) noexcept {
    switch (policy) {
        case RestartPolicy::Fail: return "fail";
        case RestartPolicy::Requeue: return "requeue";
        default: return "unknown";
    }
}

std::optional<RestartPolicy> restartPolicyFromString(const std::string& name) noexcept {
    std::string lower = toLowerCopy(name);
    if (lower == "fail") return RestartPolicy::Fail;
    if (lower == "requeue") return RestartPolicy::Requeue;
    return std::nullopt;
}

SchedulerConfig SchedulerConfig::fromEnv() {
    SchedulerConfig config;

    if (auto workers = env_positive("JOBQ_WORKERS")) {
        config.workers = static_cast<int>(std::min<long long>(*workers, 256));
    }

    if (const char* policy = std::getenv("JOBQ_RESTART_POLICY")) {
        if (auto parsed = restartPolicyFromString(policy)) {
            config.restartPolicy = *parsed;
        } else {
            LOG_WARN(std::string("Ignoring invalid JOBQ_RESTART_POLICY=") + policy);
        }
    }

    if (auto interval = env_positive("JOBQ_SCAN_INTERVAL_MS")) {
        config.scanInterval = std::chrono::milliseconds(*interval);
    }

    return config;
}

}
