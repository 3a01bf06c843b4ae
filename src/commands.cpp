/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/commands.hpp"
#include "jobq/context.hpp"
#include "jobq/errors.hpp"
#include "jobq/logger.hpp"
#include "jobq/registry.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace jobq {

namespace {
// Positional argument first, then keyword argument of the same name.
const nlohmann::json* argument(const nlohmann::json& args, const nlohmann::json& kwargs,
                               std::size_t index, const char* name) {
    if (args.is_array() && args.size() > index) {
        return &args[index];
    }
    if (kwargs.is_object()) {
        auto it = kwargs.find(name);
        if (it != kwargs.end()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string stringArgument(const nlohmann::json& args, const nlohmann::json& kwargs,
                           std::size_t index, const char* name) {
    const auto* value = argument(args, kwargs, index, name);
    if (!value || !value->is_string() || value->get<std::string>().empty()) {
        throw std::invalid_argument(std::string("missing string argument '") + name + "'");
    }
    return value->get<std::string>();
}

// Longest accepted sleep; keeps the tick arithmetic inside steady_clock's range.
constexpr double kMaxSleepSeconds = 365.0 * 24 * 3600;

struct CopyItem {
    std::filesystem::path source;
    std::filesystem::path target;
    std::uintmax_t size = 0;
};
}

void sleepCommand(JobContext& context, const nlohmann::json& args, const nlohmann::json& kwargs) {
    const auto* value = argument(args, kwargs, 0, "seconds");
    if (!value || !value->is_number() || value->get<double>() < 0.0) {
        throw std::invalid_argument("sleep needs a non-negative number of seconds");
    }
    if (value->get<double>() > kMaxSleepSeconds) {
        throw std::invalid_argument("sleep longer than one year");
    }

    const auto tick = std::chrono::milliseconds(100);
    const auto total = std::chrono::duration<double>(value->get<double>());
    const auto start = std::chrono::steady_clock::now();

    while (true) {
        context.checkForCancel();

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed >= total) {
            break;
        }
        context.updateProgress(std::chrono::duration<double>(elapsed).count(), total.count());
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            tick, std::chrono::duration_cast<std::chrono::steady_clock::duration>(total - elapsed)));
    }
}

void copyCommand(JobContext& context, const nlohmann::json& args, const nlohmann::json& kwargs) {
    const std::filesystem::path source = stringArgument(args, kwargs, 0, "source");
    const std::filesystem::path destination = stringArgument(args, kwargs, 1, "destination");

    if (!std::filesystem::exists(source)) {
        throw std::invalid_argument("copy source does not exist: " + source.string());
    }

    std::vector<CopyItem> items;
    std::uintmax_t totalBytes = 0;
    if (std::filesystem::is_directory(source)) {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(source)) {
            if (entry.is_regular_file()) {
                CopyItem item{entry.path(), destination / entry.path().lexically_relative(source),
                              entry.file_size()};
                totalBytes += item.size;
                items.push_back(std::move(item));
            }
        }
    } else {
        CopyItem item{source, destination, std::filesystem::file_size(source)};
        totalBytes = item.size;
        items.push_back(std::move(item));
    }

    LOG_DEBUG("Job " + context.jobId() + " copying " + std::to_string(items.size()) +
              " file(s), " + std::to_string(totalBytes) + " bytes");

    const bool destinationExisted = std::filesystem::exists(destination);
    std::vector<std::filesystem::path> written;
    std::uintmax_t copiedBytes = 0;

    try {
        for (std::size_t i = 0; i < items.size(); ++i) {
            context.checkForCancel();

            const auto& item = items[i];
            try {
                if (item.target.has_parent_path()) {
                    std::filesystem::create_directories(item.target.parent_path());
                }
                std::filesystem::copy_file(item.source, item.target,
                                           std::filesystem::copy_options::overwrite_existing);
            } catch (const std::filesystem::filesystem_error&) {
                std::throw_with_nested(std::runtime_error("Failed to copy " + item.source.string()));
            }
            written.push_back(item.target);

            copiedBytes += item.size;
            if (totalBytes > 0) {
                context.updateProgress(static_cast<double>(copiedBytes), static_cast<double>(totalBytes));
            } else {
                context.updateProgress(static_cast<double>(i + 1), static_cast<double>(items.size()));
            }
        }
    } catch (const JobCancelled&) {
        std::error_code ec;
        if (!destinationExisted) {
            std::filesystem::remove_all(destination, ec);
        } else {
            for (const auto& path : written) {
                std::filesystem::remove(path, ec);
            }
        }
        LOG_INFO("Job " + context.jobId() + " cancelled, removed partial copy at " + destination.string());
        throw;
    }
}

void registerBuiltinCommands(Registry& registry) {
    registry.add("sleep", sleepCommand);
    registry.add("copy", copyCommand);
}

}
