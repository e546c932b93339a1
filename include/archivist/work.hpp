/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "archivist/config.hpp"
#include "archivist/types.hpp"

namespace archivist {

enum class SubmissionError : std::uint8_t {
    None = 0,
    InvalidName,
    InvalidSource,
    InvalidConfig,
    IoError,
    WorkspaceError
};

[[nodiscard]] const char* toString(SubmissionError error) noexcept;

struct SubmitResult {
    bool ok = false;
    PackageId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Intake: validates a submission, stages it under intake/writing and
// publishes it to intake/ready with a single rename.
class Work final {
public:
    explicit Work(const std::filesystem::path& workspace, bool createIfMissing = true);

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;
    Work(Work&&) noexcept = default;
    Work& operator=(Work&&) noexcept = default;

    // `config` is overlaid on the defaults; null means all defaults.
    [[nodiscard]] SubmitResult submit(const std::string& name, const std::string& sourceLocation,
                                      const nlohmann::json& config);
    [[nodiscard]] SubmitResult submit(const std::string& name, const std::string& sourceLocation,
                                      const ProcessingConfig& config);

    [[nodiscard]] bool isReady() const noexcept { return ready_; }

private:
    std::filesystem::path workspace_;
    bool ready_ = false;

    [[nodiscard]] bool createPackageDirectory(const PackageId& id) const noexcept;
    [[nodiscard]] bool writePackageFile(const PackageId& id, const std::string& name, const std::string& sourceLocation,
                                        const ProcessingConfig& config) const noexcept;
    [[nodiscard]] bool copySource(const PackageId& id, const std::filesystem::path& source) const noexcept;
    [[nodiscard]] bool atomicPublish(const PackageId& id) const noexcept;
    void cleanupFailedPackage(const PackageId& id) const noexcept;
    [[nodiscard]] std::filesystem::path stagingPath(const PackageId& id) const;
};

// "file:///data/x" and "/data/x" name the same source.
[[nodiscard]] std::filesystem::path resolveSourceLocation(const std::string& sourceLocation);

// intake/writing, intake/ready, packages, completed, tmp
[[nodiscard]] bool createWorkspaceLayout(const std::filesystem::path& workspace) noexcept;

}
