/*
 * jobq - Scheduler daemon (jobqd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/server.hpp"
#include "jobq/registry.hpp"
#include "jobq/logger.hpp"
#include <iostream>
#include <fstream>
#include <chrono>
#include <thread>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <optional>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

using namespace jobq;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "jobq Scheduler Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [-w <workers>] [--requeue | --fail-stale]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace       Directory holding the job store and request inbox\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --workers <n>  Number of worker slots (default 4)\n";
    std::cout << "  --requeue          Run jobs interrupted by a previous stop again\n";
    std::cout << "  --fail-stale       Mark jobs interrupted by a previous stop FAILED (default)\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  JOBQ_LOG_LEVEL         Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  JOBQ_WORKERS           Default worker count\n";
    std::cout << "  JOBQ_RESTART_POLICY    fail | requeue\n";
    std::cout << "  JOBQ_SCAN_INTERVAL_MS  Inbox polling interval\n";
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();

    std::filesystem::path workspace = argv[1];
    SchedulerConfig config = SchedulerConfig::fromEnv();

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                config.workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
            if (config.workers <= 0) {
                std::cerr << "Error: Worker count must be positive\n";
                return 1;
            }
        } else if (arg == "--requeue") {
            config.restartPolicy = RestartPolicy::Requeue;
        } else if (arg == "--fail-stale") {
            config.restartPolicy = RestartPolicy::Fail;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        }
    }

    std::filesystem::path pidPath = workspace / ".jobqd.pid";
    if (auto pid = readPidFile(pidPath)) {
        if (isProcessAlive(*pid)) {
            std::cerr << "Error: jobqd already running for " << workspace.string()
                      << " (pid " << *pid << ")\n";
            return 1;
        }
        LOG_WARN("Removing stale pid file for pid " + std::to_string(*pid));
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        Server server(workspace, config);
        if (!server.start()) {
            std::cerr << "Error: Failed to start server\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "jobqd " << VERSION << " running\n";
        std::cout << "  Workspace  " << workspace.string() << "\n";
        std::cout << "  Workers    " << config.workers << "\n";
        std::cout << "  Restart    " << restartPolicyToString(config.restartPolicy) << "\n";
        std::cout << "  Commands  ";
        for (const auto& name : server.registry().names()) {
            std::cout << " " << name;
        }
        std::cout << "\n" << std::flush;

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping server...");
        server.shutdown();

        std::error_code ec;
        std::filesystem::remove(pidPath, ec);

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("jobqd stopped");
    return 0;
}
