/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/scanner.hpp"
#include "archivist/logger.hpp"
#include <algorithm>

namespace archivist {

Scanner::Scanner(const std::filesystem::path& workspace) noexcept
    : readyPath_(workspace / "intake" / "ready") {
}

std::vector<PackageId> Scanner::scan() const noexcept {
    std::vector<PackageId> packages;

    try {
        if (!std::filesystem::exists(readyPath_)) {
            LOG_DEBUG("Ready directory does not exist: " + readyPath_.string());
            return packages;
        }

        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (entry.is_directory() && isValidPackageDirectory(entry.path())) {
                packages.push_back(entry.path().filename().string());
                LOG_TRACE("Found package: " + packages.back());
            }
        }

        // Ids are time-ordered
        std::sort(packages.begin(), packages.end());

        if (!packages.empty()) {
            LOG_DEBUG("Scanner found " + std::to_string(packages.size()) + " ready packages");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    }

    return packages;
}

std::size_t Scanner::readyCount() const noexcept {
    return scan().size();
}

bool Scanner::isValidPackageDirectory(const std::filesystem::path& dir) const noexcept {
    std::error_code ec;
    auto record = dir / "package.json";
    if (!std::filesystem::is_regular_file(record, ec) || std::filesystem::file_size(record, ec) == 0 || ec) {
        LOG_DEBUG("Invalid package directory (missing package.json): " + dir.string());
        return false;
    }
    return true;
}

}
