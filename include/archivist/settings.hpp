/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace archivist {

// Deployment configuration of the daemon. Command-line flags win over
// ARCHIVIST_* environment variables, which win over the defaults.
struct Settings {
    std::filesystem::path workspace;
    std::filesystem::path workflowPath;
    int packageWorkers = 2;
    int taskWorkers = 4;
    std::chrono::milliseconds scanInterval{1000};
    std::filesystem::path toolsDirectory;
    std::size_t outputLimit = 1024 * 1024;

    // Defaults overlaid with ARCHIVIST_PACKAGE_WORKERS, ARCHIVIST_TASK_WORKERS,
    // ARCHIVIST_SCAN_INTERVAL_MS, ARCHIVIST_TOOLS_DIR, ARCHIVIST_OUTPUT_LIMIT
    // and ARCHIVIST_WORKFLOW.
    [[nodiscard]] static Settings fromEnvironment();

    // Consumes recognised flags from `args`; positional arguments are left
    // in place. False with `error` set on a malformed flag.
    [[nodiscard]] bool applyArguments(std::vector<std::string>& args, std::string& error);

    [[nodiscard]] bool validate(std::string& error) const;
    [[nodiscard]] std::string describe() const;
};

}
