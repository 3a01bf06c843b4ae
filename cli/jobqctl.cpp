/*
 * jobq - Operator tool (jobqctl)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/inbox.hpp"
#include "jobq/job.hpp"
#include "jobq/logger.hpp"
#include "jobq/storage.hpp"
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace jobq;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "jobq Operator Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <command> [arguments]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  submit <function> [args...]   Queue a job, prints its id\n";
    std::cout << "      --kw <key=value>          Keyword argument (repeatable)\n";
    std::cout << "      --meta <key=value>        Extra metadata field (repeatable)\n";
    std::cout << "      --cancellable             Allow the job to be cancelled\n";
    std::cout << "      --track-progress          Record progress reported by the job\n";
    std::cout << "  cancel <id>                   Cancel a job\n";
    std::cout << "  clear <id>                    Remove a finished job\n";
    std::cout << "  clear-all                     Remove every finished job\n";
    std::cout << "  empty                         Cancel every unfinished job\n";
    std::cout << "  list                          List jobs\n";
    std::cout << "  show <id> [--wait]            Print a job summary as JSON\n\n";
    std::cout << "Values are parsed as JSON when possible, otherwise taken as strings.\n";
    std::cout << "Requests are applied by jobqd running on the same workspace.\n\n";
    std::cout << "Exit codes for show: 0 completed, 1 failed/canceled/missing, 2 not finished or still pending\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace submit sleep 30 --cancellable --track-progress\n";
    std::cout << "  " << progName << " ./workspace submit copy /media/usb/data ./export --meta type=DISKEXPORT\n";
    std::cout << "  " << progName << " ./workspace show 1731808123456789_12345_0 --wait\n";
}

nlohmann::json parseValue(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        return text;
    }
}

bool parseKeyValue(const std::string& text, nlohmann::json& target) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    target[text.substr(0, eq)] = parseValue(text.substr(eq + 1));
    return true;
}

int postRequest(const std::string& workspace, const Request& request) {
    Inbox inbox(workspace, false);
    if (!inbox.isReady()) {
        std::cerr << "Error: No jobq workspace at " << workspace << "\n";
        return 1;
    }
    auto result = inbox.post(request);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }
    return 0;
}

int submit(const std::string& workspace, int argc, char* argv[], int first) {
    if (first >= argc) {
        std::cerr << "Error: submit needs a function name\n";
        return 1;
    }

    Request request;
    request.kind = RequestKind::Submit;
    request.function = argv[first];
    request.jobId = generateJobId();

    for (int i = first + 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--kw" || arg == "--meta") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires key=value\n";
                return 1;
            }
            auto& target = arg == "--kw" ? request.kwargs : request.extraMetadata;
            if (!parseKeyValue(argv[++i], target)) {
                std::cerr << "Error: Expected key=value, got: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--cancellable") {
            request.cancellable = true;
        } else if (arg == "--track-progress") {
            request.trackProgress = true;
        } else {
            request.args.push_back(parseValue(arg));
        }
    }

    int rc = postRequest(workspace, request);
    if (rc == 0) {
        // Just the job id, clean for piping
        std::cout << request.jobId << std::endl;
    }
    return rc;
}

int listJobs(const std::string& workspace) {
    FileStorage storage(workspace, true);
    for (const auto& job : storage.list()) {
        std::cout << std::left << std::setw(32) << job.id << " "
                  << std::setw(10) << stateToString(job.state) << " "
                  << std::right << std::setw(5) << std::fixed << std::setprecision(1)
                  << job.percentage_progress * 100.0 << "%  "
                  << job.function << "\n";
    }
    return 0;
}

// How long --wait keeps looking for a record that is neither stored nor
// pending; covers the daemon taking the request before creating it.
constexpr auto kApplyGrace = std::chrono::seconds(2);

int showJob(const std::string& workspace, const JobId& id, bool wait) {
    FileStorage storage(workspace, true);
    Inbox inbox(workspace, false);

    auto lastSeenPending = std::chrono::steady_clock::now();
    while (true) {
        auto job = storage.get(id);
        if (job) {
            if (!wait || isTerminal(job->state)) {
                std::cout << job->summary().dump(2) << std::endl;
                if (job->state == State::Completed) return 0;
                if (isTerminal(job->state)) return 1;
                return 2;
            }
        } else if (inbox.isReady() && inbox.hasPendingSubmit(id)) {
            // Posted but not applied yet
            if (!wait) {
                auto summary = emptySummary();
                summary["id"] = id;
                std::cout << summary.dump(2) << std::endl;
                return 2;
            }
            lastSeenPending = std::chrono::steady_clock::now();
        } else if (!wait || std::chrono::steady_clock::now() - lastSeenPending > kApplyGrace) {
            std::cerr << "Job not found: " << id << std::endl;
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; JOBQ_LOG_LEVEL overrides
    if (!std::getenv("JOBQ_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string command = argv[2];

    try {
        if (command == "submit") {
            return submit(workspace, argc, argv, 3);
        }
        if (command == "cancel" || command == "clear") {
            if (argc < 4) {
                std::cerr << "Error: " << command << " needs a job id\n";
                return 1;
            }
            if (!isValidJobId(argv[3])) {
                std::cerr << "Error: Invalid job id: " << argv[3] << "\n";
                return 1;
            }
            Request request;
            request.kind = command == "cancel" ? RequestKind::Cancel : RequestKind::Clear;
            request.jobId = argv[3];
            return postRequest(workspace, request);
        }
        if (command == "clear-all" || command == "empty") {
            Request request;
            request.kind = command == "empty" ? RequestKind::Empty : RequestKind::ClearAll;
            return postRequest(workspace, request);
        }
        if (command == "list") {
            return listJobs(workspace);
        }
        if (command == "show") {
            if (argc < 4) {
                std::cerr << "Error: show needs a job id\n";
                return 1;
            }
            bool wait = argc > 4 && (std::string(argv[4]) == "-w" || std::string(argv[4]) == "--wait");
            return showJob(workspace, argv[3], wait);
        }

        std::cerr << "Error: Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
