/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace jobq {

// Job lifecycle states. SCHEDULED, QUEUED, RUNNING and CANCELING are
// transient; COMPLETED, FAILED and CANCELED are terminal.
enum class State : std::uint8_t {
    Scheduled,
    Queued,
    Running,
    Canceling,
    Canceled,
    Completed,
    Failed
};

// Opaque job identifier.
using JobId = std::string;

[[nodiscard]] const char* stateToString(State state) noexcept;
[[nodiscard]] std::optional<State> stateFromString(const std::string& name) noexcept;

[[nodiscard]] bool isTerminal(State state) noexcept;
[[nodiscard]] bool canTransition(State from, State to) noexcept;

} // namespace jobq
