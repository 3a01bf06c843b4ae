/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "jobq/types.hpp"

namespace jobq {

enum class RequestKind : uint8_t {
    Submit = 0,
    Cancel,
    Clear,
    ClearAll,
    Empty
};

[[nodiscard]] const char* requestKindToString(RequestKind kind) noexcept;
[[nodiscard]] std::optional<RequestKind> requestKindFromString(const std::string& name) noexcept;

// An operator request written by another process for the daemon to apply.
struct Request {
    RequestKind kind = RequestKind::Submit;
    JobId jobId;
    std::string function;
    nlohmann::json args = nlohmann::json::array();
    nlohmann::json kwargs = nlohmann::json::object();
    bool cancellable = false;
    bool trackProgress = false;
    nlohmann::json extraMetadata = nlohmann::json::object();
};

[[nodiscard]] nlohmann::json toJson(const Request& request);
// Throws std::invalid_argument for a malformed request.
[[nodiscard]] Request requestFromJson(const nlohmann::json& json);

struct PostResult {
    bool ok = false;
    std::string requestId;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

/**
 * Request drop box under <workspace>/requests. Writers stage a file in
 * writing/ and publish it into ready/ with a rename; the daemon takes ready
 * requests oldest first. Unparseable requests are moved to rejected/.
 */
class Inbox final {
public:
    explicit Inbox(const std::filesystem::path& workspace, bool createIfMissing = true);

    Inbox(const Inbox&) = delete;
    Inbox& operator=(const Inbox&) = delete;
    Inbox(Inbox&&) noexcept = default;
    Inbox& operator=(Inbox&&) noexcept = default;

    [[nodiscard]] PostResult post(const Request& request);

    [[nodiscard]] std::vector<std::filesystem::path> scan() const noexcept;
    [[nodiscard]] std::optional<Request> take(const std::filesystem::path& path) noexcept;
    [[nodiscard]] std::size_t pendingCount() const noexcept;

    // True while a submit for this job id is staged or waiting in the inbox,
    // i.e. posted but not yet applied by the daemon.
    [[nodiscard]] bool hasPendingSubmit(const JobId& jobId) const noexcept;

    [[nodiscard]] bool isReady() const noexcept { return ready_; }

private:
    std::filesystem::path writingPath_;
    std::filesystem::path readyPath_;
    std::filesystem::path rejectedPath_;
    bool ready_ = false;

    [[nodiscard]] bool createDirectories(bool createIfMissing) noexcept;
    [[nodiscard]] static std::string generateRequestId();
    void reject(const std::filesystem::path& path, const std::string& reason) noexcept;
};

}
