/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/inbox.hpp"
#include "jobq/job.hpp"
#include "jobq/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace jobq {

const char* requestKindToString(RequestKind kind) noexcept {
    switch (kind) {
        case RequestKind::Submit: return "submit";
        case RequestKind::Cancel: return "cancel";
        case RequestKind::Clear: return "clear";
        case RequestKind::ClearAll: return "clear_all";
        case RequestKind::Empty: return "empty";
        default: return "unknown";
    }
}

std::optional<RequestKind> requestKindFromString(const std::string& name) noexcept {
    if (name == "submit") return RequestKind::Submit;
    if (name == "cancel") return RequestKind::Cancel;
    if (name == "clear") return RequestKind::Clear;
    if (name == "clear_all") return RequestKind::ClearAll;
    if (name == "empty") return RequestKind::Empty;
    return std::nullopt;
}

nlohmann::json toJson(const Request& request) {
    nlohmann::json out = {
        {"kind", requestKindToString(request.kind)},
        {"job_id", request.jobId},
    };
    if (request.kind == RequestKind::Submit) {
        out["function"] = request.function;
        out["args"] = request.args;
        out["kwargs"] = request.kwargs;
        out["cancellable"] = request.cancellable;
        out["track_progress"] = request.trackProgress;
        out["extra_metadata"] = request.extraMetadata;
    }
    return out;
}

Request requestFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("request is not a JSON object");
    }

    Request request;
    try {
        auto kindName = json.at("kind").get<std::string>();
        auto kind = requestKindFromString(kindName);
        if (!kind) {
            throw std::invalid_argument("unknown request kind '" + kindName + "'");
        }
        request.kind = *kind;
        request.jobId = json.value("job_id", std::string());

        if (request.kind == RequestKind::Submit) {
            request.function = json.at("function").get<std::string>();
            request.args = json.value("args", nlohmann::json::array());
            request.kwargs = json.value("kwargs", nlohmann::json::object());
            request.cancellable = json.value("cancellable", false);
            request.trackProgress = json.value("track_progress", false);
            request.extraMetadata = json.value("extra_metadata", nlohmann::json::object());
            if (!request.args.is_array() || !request.kwargs.is_object() ||
                !request.extraMetadata.is_object()) {
                throw std::invalid_argument("submit request has malformed arguments");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(e.what());
    }

    bool needsId = request.kind == RequestKind::Submit ||
                   request.kind == RequestKind::Cancel ||
                   request.kind == RequestKind::Clear;
    if (needsId && !isValidJobId(request.jobId)) {
        throw std::invalid_argument("invalid job_id '" + request.jobId + "'");
    }
    return request;
}

Inbox::Inbox(const std::filesystem::path& workspace, bool createIfMissing)
    : writingPath_(workspace / "requests" / "writing"),
      readyPath_(workspace / "requests" / "ready"),
      rejectedPath_(workspace / "requests" / "rejected") {
    ready_ = createDirectories(createIfMissing);
    if (!ready_) {
        LOG_ERROR("Failed to initialize request inbox: " + (workspace / "requests").string());
    }
}

PostResult Inbox::post(const Request& request) {
    if (!ready_) {
        return {false, "", "Request inbox is not available"};
    }

    std::string requestId = generateRequestId();
    auto stagingPath = writingPath_ / (requestId + ".json");
    auto readyPath = readyPath_ / (requestId + ".json");

    try {
        std::ofstream file(stagingPath, std::ios::binary);
        if (!file) {
            return {false, "", "Failed to create request file"};
        }
        file << toJson(request).dump();
        file.flush();
        if (!file.good()) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(stagingPath, ec);
            return {false, "", "Failed to write request file"};
        }
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(stagingPath, ec);
        return {false, "", std::string("Failed to write request: ") + e.what()};
    }

    std::error_code ec;
    std::filesystem::rename(stagingPath, readyPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(stagingPath, ignored);
        return {false, "", "Failed to publish request: " + ec.message()};
    }

    LOG_DEBUG("Request posted: " + requestId + " (" + requestKindToString(request.kind) + ")");
    return {true, requestId, ""};
}

std::vector<std::filesystem::path> Inbox::scan() const noexcept {
    std::vector<std::filesystem::path> requests;
    try {
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(readyPath_, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                requests.push_back(entry.path());
            }
        }
        if (ec) {
            LOG_ERROR("Inbox scan error: " + ec.message());
        }

        // Request ids sort by submission time
        std::sort(requests.begin(), requests.end());
    } catch (const std::exception& e) {
        LOG_ERROR("Inbox scan error: " + std::string(e.what()));
    }
    return requests;
}

std::optional<Request> Inbox::take(const std::filesystem::path& path) noexcept {
    try {
        nlohmann::json json;
        {
            std::ifstream file(path, std::ios::binary);
            if (!file) {
                LOG_DEBUG("Request already taken: " + path.filename().string());
                return std::nullopt;
            }
            try {
                file >> json;
            } catch (const nlohmann::json::exception& e) {
                reject(path, e.what());
                return std::nullopt;
            }
        }

        Request request;
        try {
            request = requestFromJson(json);
        } catch (const std::invalid_argument& e) {
            reject(path, e.what());
            return std::nullopt;
        }

        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            LOG_ERROR("Failed to remove taken request " + path.string() + ": " + ec.message());
            return std::nullopt;
        }
        return request;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to take request " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::size_t Inbox::pendingCount() const noexcept {
    return scan().size();
}

bool Inbox::hasPendingSubmit(const JobId& jobId) const noexcept {
    for (const auto& dir : {readyPath_, writingPath_}) {
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (entry.path().extension() != ".json") {
                continue;
            }
            try {
                std::ifstream file(entry.path(), std::ios::binary);
                auto json = nlohmann::json::parse(file, nullptr, false);
                if (json.is_object() && json.value("kind", std::string()) == "submit" &&
                    json.value("job_id", std::string()) == jobId) {
                    return true;
                }
            } catch (const std::exception& e) {
                LOG_DEBUG("Skipping unreadable request " + entry.path().string() + ": " + e.what());
            }
        }
    }
    return false;
}

bool Inbox::createDirectories(bool createIfMissing) noexcept {
    try {
        if (!createIfMissing) {
            return std::filesystem::exists(readyPath_) && std::filesystem::exists(writingPath_);
        }
        std::filesystem::create_directories(writingPath_);
        std::filesystem::create_directories(readyPath_);
        std::filesystem::create_directories(rejectedPath_);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create inbox directories: " + std::string(e.what()));
        return false;
    }
}

std::string Inbox::generateRequestId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(20) << now << "_" << getpid() << "_"
       << std::setw(8) << counter.fetch_add(1);
    return ss.str();
}

void Inbox::reject(const std::filesystem::path& path, const std::string& reason) noexcept {
    LOG_ERROR("Rejecting malformed request " + path.filename().string() + ": " + reason);
    std::error_code ec;
    std::filesystem::create_directories(rejectedPath_, ec);
    std::filesystem::rename(path, rejectedPath_ / path.filename(), ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(path, ignored);
    }
}

}
