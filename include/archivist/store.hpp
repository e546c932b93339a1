/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "archivist/config.hpp"
#include "archivist/types.hpp"
#include "archivist/util.hpp"

namespace archivist {

struct FailureDetail {
    FailureKind kind = FailureKind::None;
    std::string message;
};

struct PackageRecord {
    PackageId id;
    std::string name;
    std::string sourceLocation;
    PackageStatus status = PackageStatus::Processing;
    FailureDetail failure;
    ProcessingConfig config;
    std::map<std::string, std::string> variables;
    TimePoint createdAt;
    std::optional<TimePoint> completedAt;
    bool purged = false;

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static std::optional<PackageRecord> fromJson(const nlohmann::json& doc) noexcept;
    [[nodiscard]] static std::optional<PackageRecord> load(const std::filesystem::path& path) noexcept;
};

struct JobRecord {
    JobId id;
    PackageId packageId;
    LinkId linkId;
    std::string name;
    std::string group;
    ChainId chainId;
    LinkId originLink;
    std::uint64_t sequence = 0;
    JobStatus status = JobStatus::Processing;
    TimePoint startTime;
    std::optional<TimePoint> endTime;
    std::optional<int> exitCode;
    LinkId nextLink;
    std::optional<Outcome> outcome;
    FailureDetail error;

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static std::optional<JobRecord> fromJson(const nlohmann::json& doc) noexcept;
};

struct TaskRecord {
    TaskId id;
    JobId jobId;
    FileId fileId; // empty for package-level tasks
    std::string filename;
    std::uint64_t sequence = 0;
    std::string execution;
    std::vector<std::string> arguments;
    std::optional<int> exitCode;
    std::string stdoutText;
    std::string stderrText;
    TimePoint startTime;
    std::optional<TimePoint> endTime;
    bool truncated = false;

    [[nodiscard]] bool completed() const noexcept { return exitCode.has_value(); }

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static std::optional<TaskRecord> fromJson(const nlohmann::json& doc) noexcept;
};

struct FileEntry {
    FileId id;
    std::string path; // relative to the working directory
};

enum class ClaimResult : std::uint8_t { Created, Duplicate, IoError };

// Durable package/job/task records under <workspace>/packages/<id>/.
// Thread-safe; every record write is atomic.
class Store final {
public:
    explicit Store(const std::filesystem::path& workspace) noexcept;

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) = delete;
    Store& operator=(Store&&) = delete;

    [[nodiscard]] bool createPackage(const PackageRecord& record) noexcept;
    [[nodiscard]] std::optional<PackageRecord> package(const PackageId& id) const noexcept;
    [[nodiscard]] PackageStatus packageStatus(const PackageId& id) const noexcept;
    [[nodiscard]] std::vector<PackageId> packageIds() const noexcept;

    // The only way a package leaves PROCESSING. False if it already did.
    [[nodiscard]] bool finishPackage(const PackageId& id, PackageStatus status, const FailureDetail& failure) noexcept;
    [[nodiscard]] bool setVariable(const PackageId& id, const std::string& name, const std::string& value) noexcept;

    // Assigns id and sequence. Refused once the package is terminal.
    [[nodiscard]] std::optional<JobRecord> createJob(JobRecord job) noexcept;
    // Persists a terminal job. False unless the stored job is PROCESSING.
    [[nodiscard]] bool finishJob(const JobRecord& job) noexcept;
    [[nodiscard]] std::vector<JobRecord> jobs(const PackageId& packageId) const noexcept;
    [[nodiscard]] std::optional<JobRecord> job(const JobId& id) const noexcept;

    // Exclusive on (job, file): a second claim returns Duplicate.
    [[nodiscard]] ClaimResult createTask(const JobRecord& job, TaskRecord& task) noexcept;
    [[nodiscard]] bool completeTask(const JobRecord& job, const TaskRecord& task) noexcept;
    [[nodiscard]] std::vector<TaskRecord> tasks(const JobRecord& job) const noexcept;
    [[nodiscard]] std::vector<TaskRecord> tasks(const JobId& jobId) const noexcept;

    // Ids are assigned in sorted path order on first sight and never change.
    [[nodiscard]] std::optional<std::vector<FileEntry>> registerFiles(const PackageId& id,
                                                                      std::vector<std::string> paths) noexcept;
    [[nodiscard]] std::vector<FileEntry> files(const PackageId& id) const noexcept;

    [[nodiscard]] std::filesystem::path packageDirectory(const PackageId& id) const;
    [[nodiscard]] std::filesystem::path workDirectory(const PackageId& id) const;
    [[nodiscard]] bool purgeWorkDirectory(const PackageId& id) noexcept;

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

private:
    [[nodiscard]] std::filesystem::path jobDirectory(const PackageId& packageId, const JobId& jobId) const;
    [[nodiscard]] std::filesystem::path taskPath(const JobRecord& job, const FileId& fileId) const;
    [[nodiscard]] bool writePackage(const PackageRecord& record) noexcept;
    [[nodiscard]] std::optional<PackageId> packageOfJob(const JobId& jobId) const noexcept;
    [[nodiscard]] std::uint64_t nextTaskSequence(const JobRecord& job);
    void rememberJob(const JobId& jobId, const PackageId& packageId) const;
    // Drops cached sequences and job lookups of a package that went terminal.
    void forgetPackage(const PackageId& id);

    std::filesystem::path workspace_;
    std::filesystem::path packagesPath_;

    // Guards read-modify-write of package.json and files.json.
    mutable std::mutex packageMutex_;

    // In-memory caches over the job directories. Entries of terminal
    // packages are dropped; lookups that miss fall back to a disk scan.
    static constexpr std::size_t kJobIndexLimit = 4096;
    mutable std::mutex indexMutex_;
    mutable std::unordered_map<JobId, PackageId> jobIndex_;
    std::unordered_map<PackageId, std::uint64_t> jobSequence_;
    std::unordered_map<JobId, std::uint64_t> taskSequence_;
};

}
