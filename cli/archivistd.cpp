/*
 * archivist - Server daemon (archivistd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/server.hpp"
#include "archivist/logger.hpp"
#include "archivist/settings.hpp"
#include "archivist/workflow.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace archivist;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "archivist Preservation Workflow Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> --workflow <file> [options]\n";
    std::cout << "       " << progName << " --check <workflow>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --workflow <file>          Workflow graph (JSON)\n";
    std::cout << "  -p, --package-workers <n>  Packages processed concurrently (default 2)\n";
    std::cout << "  -t, --task-workers <n>     Per-file tasks run concurrently (default 4)\n";
    std::cout << "  --scan-interval <ms>       Intake scan interval (default 1000)\n";
    std::cout << "  --tools <dir>              Directory searched for tools before PATH\n";
    std::cout << "  --output-limit <bytes>     Captured stdout/stderr per task (default 1048576)\n";
    std::cout << "  --check <workflow>         Validate a workflow file and exit\n";
    std::cout << "  --log-level <level>        Override ARCHIVIST_LOG_LEVEL\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  ARCHIVIST_WORKFLOW, ARCHIVIST_PACKAGE_WORKERS, ARCHIVIST_TASK_WORKERS,\n";
    std::cout << "  ARCHIVIST_SCAN_INTERVAL_MS, ARCHIVIST_TOOLS_DIR, ARCHIVIST_OUTPUT_LIMIT\n";
    std::cout << "  ARCHIVIST_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
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

int checkWorkflow(const std::string& path) {
    try {
        auto workflow = Workflow::load(path);
        std::cout << path << ": OK (" << workflow->chains().size() << " chains, " << workflow->links().size()
                  << " links, entry " << workflow->entryChain().id << ")\n";
        for (const auto& id : workflow->unreachableLinks()) {
            std::cout << "  unreachable: " << id << "\n";
        }
        return 0;
    } catch (const WorkflowError& e) {
        std::cerr << path << ": " << e.what() << "\n";
        return 1;
    }
}

int main(int argc, char* argv[]) {
    Logger::configure(LogLevel::INFO);

    std::vector<std::string> args(argv + 1, argv + argc);
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-h" || args[i] == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (args[i] == "-v" || args[i] == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (args[i] == "--check") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --check requires a workflow file\n";
                return 1;
            }
            return checkWorkflow(args[i + 1]);
        }
    }

    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it != "--log-level") {
            continue;
        }
        LogLevel level = LogLevel::INFO;
        if (it + 1 == args.end() || !Logger::parseLevel(*(it + 1), level)) {
            std::cerr << "Error: --log-level requires one of error, warn, info, debug, trace\n";
            return 1;
        }
        Logger::setLevel(level);
        args.erase(it, it + 2);
        break;
    }

    Settings settings = Settings::fromEnvironment();
    std::string error;
    if (!settings.applyArguments(args, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    if (args.size() != 1) {
        printUsage(argv[0]);
        return 1;
    }
    settings.workspace = args[0];
    if (!settings.validate(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    std::filesystem::path pidPath = settings.workspace / ".archivistd.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid)) {
        std::cerr << "Error: archivistd already running on " << settings.workspace.string() << " (pid " << *pid
                  << ")\n";
        return 1;
    }

    std::shared_ptr<const Workflow> workflow;
    try {
        workflow = Workflow::load(settings.workflowPath);
    } catch (const WorkflowError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        Server server(settings, workflow);
        if (!server.start()) {
            std::cerr << "Failed to start\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            } else {
                LOG_WARN("Cannot write pid file: " + pidPath.string());
            }
        }

        LOG_INFO("archivistd " + std::string(VERSION) + " serving " + settings.workspace.string());

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping server...");
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("archivistd stopped");
    return 0;
}
