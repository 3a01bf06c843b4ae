/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/job.hpp"
#include "jobq/errors.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <unistd.h>

namespace jobq {

const char* stateToString(State state) noexcept {
    switch (state) {
        case State::Scheduled: return "SCHEDULED";
        case State::Queued: return "QUEUED";
        case State::Running: return "RUNNING";
        case State::Canceling: return "CANCELING";
        case State::Canceled: return "CANCELED";
        case State::Completed: return "COMPLETED";
        case State::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

std::optional<State> stateFromString(const std::string& name) noexcept {
    if (name == "SCHEDULED") return State::Scheduled;
    if (name == "QUEUED") return State::Queued;
    if (name == "RUNNING") return State::Running;
    if (name == "CANCELING") return State::Canceling;
    if (name == "CANCELED") return State::Canceled;
    if (name == "COMPLETED") return State::Completed;
    if (name == "FAILED") return State::Failed;
    return std::nullopt;
}

bool isTerminal(State state) noexcept {
    return state == State::Canceled || state == State::Completed || state == State::Failed;
}

bool canTransition(State from, State to) noexcept {
    switch (from) {
        case State::Scheduled:
            return to == State::Queued || to == State::Canceled || to == State::Failed;
        case State::Queued:
            return to == State::Running || to == State::Canceled || to == State::Failed;
        case State::Running:
            return to == State::Completed || to == State::Failed ||
                   to == State::Canceling || to == State::Canceled ||
                   to == State::Queued;  // restart requeue
        case State::Canceling:
            return to == State::Canceled || to == State::Completed || to == State::Failed;
        default:
            return false;
    }
}

nlohmann::json Job::summary() const {
    nlohmann::json out = {
        {"id", id},
        {"status", stateToString(state)},
        {"percentage", percentage_progress},
        {"cancellable", cancellable},
        {"exception", exception},
        {"traceback", traceback},
    };
    if (extra_metadata.is_object()) {
        for (auto it = extra_metadata.begin(); it != extra_metadata.end(); ++it) {
            out[it.key()] = it.value();
        }
    }
    return out;
}

bool JobUpdate::matches(State current) const noexcept {
    return expected.empty() ||
           std::find(expected.begin(), expected.end(), current) != expected.end();
}

void JobUpdate::applyTo(Job& job) const {
    if (state) job.state = *state;
    if (progress) job.percentage_progress = std::clamp(*progress, 0.0, 1.0);
    if (exception) job.exception = *exception;
    if (traceback) job.traceback = *traceback;
}

nlohmann::json emptySummary() {
    return {
        {"type", nullptr},
        {"started_by", nullptr},
        {"status", stateToString(State::Scheduled)},
        {"percentage", 0},
        {"id", nullptr},
        {"cancellable", false},
    };
}

nlohmann::json toJson(const Job& job) {
    auto createdMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        job.created_at.time_since_epoch()).count();

    return {
        {"id", job.id},
        {"sequence", job.sequence},
        {"function", job.function},
        {"args", job.args},
        {"kwargs", job.kwargs},
        {"state", stateToString(job.state)},
        {"percentage_progress", job.percentage_progress},
        {"cancellable", job.cancellable},
        {"track_progress", job.track_progress},
        {"exception", job.exception},
        {"traceback", job.traceback},
        {"extra_metadata", job.extra_metadata},
        {"created_at", createdMs},
    };
}

Job fromJson(const nlohmann::json& json) {
    try {
        Job job;
        job.id = json.at("id").get<std::string>();
        job.sequence = json.at("sequence").get<std::uint64_t>();
        job.function = json.at("function").get<std::string>();
        job.args = json.value("args", nlohmann::json::array());
        job.kwargs = json.value("kwargs", nlohmann::json::object());

        auto stateName = json.at("state").get<std::string>();
        auto state = stateFromString(stateName);
        if (!state) {
            throw StorageError("Unknown job state '" + stateName + "' in record " + job.id);
        }
        job.state = *state;

        job.percentage_progress = json.value("percentage_progress", 0.0);
        job.cancellable = json.value("cancellable", false);
        job.track_progress = json.value("track_progress", false);
        job.exception = json.value("exception", std::string());
        job.traceback = json.value("traceback", std::string());
        job.extra_metadata = json.value("extra_metadata", nlohmann::json::object());
        job.created_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(json.value("created_at", std::int64_t{0})));
        return job;
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Malformed job record: " + std::string(e.what()));
    }
}

JobId generateJobId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

bool isValidJobId(const JobId& id) noexcept {
    if (id.empty() || id.size() > 128 || id.front() == '.') {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

}
