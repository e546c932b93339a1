/*
 * archivist - Workspace cleanup tool (arempty)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/service.hpp"
#include "archivist/logger.hpp"
#include <cstdlib>
#include <iostream>

using namespace archivist;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "archivist Workspace Cleanup Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace>\n\n";
    std::cout << "Removes the working files of every COMPLETE, FAILED or REJECTED package.\n";
    std::cout << "Package and job records stay readable; PROCESSING packages are untouched.\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  ARCHIVIST_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
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

    if (argc != 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Service service(argv[1], false);
        if (!service.isReady()) {
            std::cerr << "Error: Not a workspace: " << argv[1] << std::endl;
            return 1;
        }
        std::cout << service.empty() << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
