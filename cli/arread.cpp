/*
 * archivist - Package status tool (arread)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/service.hpp"
#include "archivist/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace archivist;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "archivist Package Status Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [package_id] [--wait] [--json]\n";
    std::cout << "       " << progName << " <workspace> --tasks <job_id> [--json]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Workspace served by archivistd\n";
    std::cout << "  package_id    Package to read (read from stdin when piped)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait         Block until the package is terminal\n";
    std::cout << "  --tasks <job_id>   List the tasks of one job\n";
    std::cout << "  --json             Print JSON instead of text\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Exit status: 0 COMPLETE, 1 FAILED/REJECTED/unknown, 2 still PROCESSING\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  ARCHIVIST_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace 0001731808123456_0012345_00000000\n";
    std::cout << "  arsub ./workspace letters ./letters | " << progName << " ./workspace --wait\n";
}

std::string optionalCode(const std::optional<int>& code) {
    return code ? std::to_string(*code) : std::string("-");
}

int printTasks(const Service& service, const JobId& jobId, bool asJson) {
    auto tasks = service.listTasks(jobId);

    if (asJson) {
        nlohmann::json doc = nlohmann::json::array();
        for (const auto& task : tasks) {
            doc.push_back(task.toJson());
        }
        std::cout << dumpJson(doc, 2) << std::endl;
        return 0;
    }

    if (tasks.empty()) {
        std::cerr << "No tasks for job: " << jobId << std::endl;
        return 1;
    }
    for (const auto& task : tasks) {
        std::cout << task.id << "  exit=" << optionalCode(task.exitCode) << "  "
                  << (task.filename.empty() ? std::string("(package)") : task.filename) << "\n";
        std::cout << "    " << task.execution;
        for (const auto& argument : task.arguments) {
            std::cout << " " << argument;
        }
        std::cout << "\n";
        if (!task.stderrText.empty()) {
            std::cout << "    stderr: " << task.stderrText;
            if (task.stderrText.back() != '\n') std::cout << "\n";
        }
    }
    return 0;
}

int printPackage(const PackageView& view, bool asJson) {
    if (asJson) {
        std::cout << dumpJson(toJson(view), 2) << std::endl;
    } else {
        std::cout << view.id << "  " << toString(view.status) << "  " << view.name << "\n";
        if (view.failure.kind != FailureKind::None) {
            std::cout << "  failure (" << toString(view.failure.kind) << "): " << view.failure.message << "\n";
        }
        for (const auto& job : view.jobs) {
            std::cout << "  " << job.id << "  " << toString(job.status) << "  " << formatTimestamp(job.startTime)
                      << "  [" << job.group << "] " << job.name << "\n";
        }
    }

    switch (view.status) {
        case PackageStatus::Complete: return 0;
        case PackageStatus::Processing: return 2; // Different exit code for "not ready"
        default: return 1;
    }
}

int main(int argc, char* argv[]) {
    // WARN keeps stdout clean for piping; ARCHIVIST_LOG_LEVEL overrides
    Logger::configure(LogLevel::WARN);

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

    std::string workspace = argv[1];
    std::string packageId;
    std::string jobId;
    bool wait = false;
    bool asJson = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "--json") {
            asJson = true;
        } else if (arg == "--tasks") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --tasks requires a job id\n";
                return 1;
            }
            jobId = argv[++i];
        } else {
            packageId = arg;
        }
    }

    // Check piped input for the package id if not provided
    if (jobId.empty() && packageId.empty() && !isatty(fileno(stdin))) {
        std::cin >> packageId;
    }

    try {
        Service service(workspace, false);
        if (!service.isReady()) {
            std::cerr << "Error: Not a workspace: " << workspace << std::endl;
            return 1;
        }

        if (!jobId.empty()) {
            return printTasks(service, jobId, asJson);
        }

        if (packageId.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        auto view = service.read(packageId);
        while (wait && view && view->status == PackageStatus::Processing) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            view = service.read(packageId);
        }

        if (!view) {
            std::cerr << "Package not found: " << packageId << std::endl;
            return 1;
        }
        return printPackage(*view, asJson);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
