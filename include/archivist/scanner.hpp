/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <vector>

#include "archivist/types.hpp"

namespace archivist {

// Lists packages published to intake/ready, oldest id first.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& workspace) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    [[nodiscard]] std::vector<PackageId> scan() const noexcept;
    [[nodiscard]] std::size_t readyCount() const noexcept;

private:
    std::filesystem::path readyPath_;

    [[nodiscard]] bool isValidPackageDirectory(const std::filesystem::path& dir) const noexcept;
};

}
