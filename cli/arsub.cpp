/*
 * archivist - Package submission tool (arsub)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/service.hpp"
#include "archivist/logger.hpp"
#include "archivist/util.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace archivist;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "archivist Package Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <name> <source> [--config <file>] [--set <option>=<value> ...]\n";
    std::cout << "       " << progName << " --options\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Workspace served by archivistd\n";
    std::cout << "  name          Package name\n";
    std::cout << "  source        File or directory to preserve (path or file:// URL)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>        Processing configuration (JSON object)\n";
    std::cout << "  --set <option>=<value> Override one option (repeatable, applied after --config)\n";
    std::cout << "  --options              List processing configuration options\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  ARCHIVIST_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace letters ./incoming/letters\n";
    std::cout << "  " << progName << " ./workspace scans file:///data/scans --set normalize=false\n";
}

void printOptions() {
    ProcessingConfig defaults;
    for (const auto& option : ProcessingConfig::options()) {
        std::cout << "  " << option.name << " = " << defaults.value(option.name).value_or("") << "  [";
        for (std::size_t i = 0; i < option.values.size(); ++i) {
            std::cout << (i ? "|" : "") << option.values[i];
        }
        std::cout << "]\n";
    }
}

// "normalize=false" -> {"normalize": false}, typed after the option.
bool applySetting(const std::string& assignment, nlohmann::json& config, std::string& error) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        error = "Expected <option>=<value>, got: " + assignment;
        return false;
    }
    std::string name = trim(assignment.substr(0, eq));
    std::string value = trim(assignment.substr(eq + 1));

    const OptionSpec* option = ProcessingConfig::findOption(name);
    if (!option) {
        error = "Unknown option: " + name;
        return false;
    }

    switch (option->kind) {
        case OptionKind::Boolean: {
            std::string lowered = toLowerCopy(value);
            if (lowered != "true" && lowered != "false") {
                error = name + " expects true or false";
                return false;
            }
            config[name] = lowered == "true";
            return true;
        }
        case OptionKind::Integer:
            if (value.empty() || value.size() > 9 || value.find_first_not_of("0123456789") != std::string::npos) {
                error = name + " expects an integer";
                return false;
            }
            config[name] = std::stoi(value);
            return true;
        case OptionKind::Enumeration:
            config[name] = value;
            return true;
    }
    error = "Unsupported option: " + name;
    return false;
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
        if (arg == "--options") {
            printOptions();
            return 0;
        }
    }

    std::vector<std::string> positional;
    std::string configFile;
    std::vector<std::string> settings;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--set") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            if (arg == "--config") {
                configFile = argv[++i];
            } else {
                settings.emplace_back(argv[++i]);
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        printUsage(argv[0]);
        return 1;
    }

    nlohmann::json config = nlohmann::json::object();
    if (!configFile.empty()) {
        auto content = readFile(configFile);
        if (!content) {
            std::cerr << "Error: Cannot read configuration file: " << configFile << "\n";
            return 1;
        }
        config = nlohmann::json::parse(*content, nullptr, false);
        if (config.is_discarded() || !config.is_object()) {
            std::cerr << "Error: Configuration file is not a JSON object: " << configFile << "\n";
            return 1;
        }
    }
    for (const auto& assignment : settings) {
        std::string error;
        if (!applySetting(assignment, config, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }

    try {
        Service service(positional[0]);
        SubmitResult result = service.submit(positional[1], positional[2], config);

        if (result) {
            // Just the package ID - clean for piping
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error (" << toString(result.error) << "): " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
