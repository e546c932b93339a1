/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "archivist/store.hpp"
#include "archivist/types.hpp"
#include "archivist/work.hpp"

namespace archivist {

struct JobView {
    JobId id;
    std::string name;
    std::string group;
    LinkId linkId;
    LinkId originLink;
    JobStatus status = JobStatus::Unspecified;
    TimePoint startTime;
};

struct PackageView {
    PackageId id;
    std::string name;
    PackageStatus status = PackageStatus::Unspecified;
    std::optional<JobId> currentJob;
    std::vector<JobView> jobs;
    FailureDetail failure;
};

[[nodiscard]] nlohmann::json toJson(const PackageView& view);

// Caller-facing operations over a workspace. Safe to use from another
// process while archivistd runs.
class Service final {
public:
    // Read-only callers pass createIfMissing=false so a mistyped path is
    // reported instead of initialised.
    explicit Service(const std::filesystem::path& workspace, bool createIfMissing = true);

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;
    Service(Service&&) = delete;
    Service& operator=(Service&&) = delete;

    [[nodiscard]] SubmitResult submit(const std::string& name, const std::string& sourceLocation,
                                      const nlohmann::json& config);
    [[nodiscard]] SubmitResult submit(const std::string& name, const std::string& sourceLocation,
                                      const ProcessingConfig& config);

    // nullopt only for ids this workspace never accepted.
    [[nodiscard]] std::optional<PackageView> read(const PackageId& id) const noexcept;
    // Empty for unknown jobs.
    [[nodiscard]] std::vector<TaskRecord> listTasks(const JobId& jobId) const noexcept;
    // Purges the working storage of every terminal package; returns how many.
    [[nodiscard]] std::size_t empty() noexcept;

    [[nodiscard]] bool isReady() const noexcept { return work_.isReady(); }
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

private:
    [[nodiscard]] std::optional<PackageView> readPublished(const PackageId& id) const noexcept;

    std::filesystem::path workspace_;
    Work work_;
    Store store_;
};

}
