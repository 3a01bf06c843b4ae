/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <nlohmann/json.hpp>

namespace jobq {

class JobContext;
class Registry;

// sleep(seconds): waits in 100 ms ticks, reporting progress and honouring
// cancellation at every tick.
void sleepCommand(JobContext& context, const nlohmann::json& args, const nlohmann::json& kwargs);

// copy(source, destination): copies a file or directory tree file by file.
// Progress is by bytes; cancellation is checked between files and removes
// whatever this job wrote.
void copyCommand(JobContext& context, const nlohmann::json& args, const nlohmann::json& kwargs);

// Registers the commands above under "sleep" and "copy".
void registerBuiltinCommands(Registry& registry);

}
