/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/settings.hpp"
#include "archivist/util.hpp"
#include <sstream>
#include <utility>

namespace archivist {

namespace {

bool parsePositive(const std::string& text, std::size_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = static_cast<std::size_t>(std::stoull(text));
    } catch (const std::exception&) {
        return false;
    }
    return out > 0;
}

}

Settings Settings::fromEnvironment() {
    Settings settings;
    settings.packageWorkers = static_cast<int>(envSize("ARCHIVIST_PACKAGE_WORKERS", settings.packageWorkers));
    settings.taskWorkers = static_cast<int>(envSize("ARCHIVIST_TASK_WORKERS", settings.taskWorkers));
    settings.scanInterval = std::chrono::milliseconds(
        envSize("ARCHIVIST_SCAN_INTERVAL_MS", static_cast<std::size_t>(settings.scanInterval.count())));
    settings.toolsDirectory = envString("ARCHIVIST_TOOLS_DIR");
    settings.outputLimit = envSize("ARCHIVIST_OUTPUT_LIMIT", settings.outputLimit);
    settings.workflowPath = envString("ARCHIVIST_WORKFLOW");
    return settings;
}

bool Settings::applyArguments(std::vector<std::string>& args, std::string& error) {
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool takesValue = arg == "--workflow" || arg == "-p" || arg == "--package-workers" || arg == "-t" ||
                          arg == "--task-workers" || arg == "--scan-interval" || arg == "--tools" ||
                          arg == "--output-limit";
        if (!takesValue) {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= args.size()) {
            error = arg + " requires a value";
            return false;
        }

        const std::string& value = args[++i];
        std::size_t number = 0;
        if (arg == "--workflow") {
            workflowPath = value;
        } else if (arg == "--tools") {
            toolsDirectory = value;
        } else if (!parsePositive(value, number)) {
            error = "Invalid value for " + arg + ": " + value;
            return false;
        } else if (arg == "-p" || arg == "--package-workers") {
            packageWorkers = static_cast<int>(number);
        } else if (arg == "-t" || arg == "--task-workers") {
            taskWorkers = static_cast<int>(number);
        } else if (arg == "--scan-interval") {
            scanInterval = std::chrono::milliseconds(number);
        } else {
            outputLimit = number;
        }
    }

    args = std::move(positional);
    return true;
}

bool Settings::validate(std::string& error) const {
    if (workspace.empty()) {
        error = "No workspace given";
        return false;
    }
    if (workflowPath.empty()) {
        error = "No workflow file given (--workflow or ARCHIVIST_WORKFLOW)";
        return false;
    }
    if (packageWorkers < 1 || taskWorkers < 1) {
        error = "Worker counts must be at least 1";
        return false;
    }
    std::error_code ec;
    if (!toolsDirectory.empty() && !std::filesystem::is_directory(toolsDirectory, ec)) {
        error = "Tools directory not found: " + toolsDirectory.string();
        return false;
    }
    return true;
}

std::string Settings::describe() const {
    std::ostringstream ss;
    ss << "workspace=" << workspace.string() << " workflow=" << workflowPath.string()
       << " package_workers=" << packageWorkers << " task_workers=" << taskWorkers
       << " scan_interval_ms=" << scanInterval.count()
       << " tools=" << (toolsDirectory.empty() ? std::string("(PATH)") : toolsDirectory.string())
       << " output_limit=" << outputLimit;
    return ss.str();
}

}
