/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "archivist/command.hpp"
#include "archivist/store.hpp"
#include "archivist/types.hpp"
#include "archivist/workflow.hpp"

namespace archivist {

class Pool;
class TaskExecutor;

// Routing code of a finished job. Package scope passes its single task.
// With `unanimous`, the first nonzero code in ascending file id order wins;
// otherwise the job always succeeds. Completion order never matters.
[[nodiscard]] int effectiveExitCode(const std::vector<TaskRecord>& tasks, bool unanimous);

// Walks the workflow graph for one package at a time. run() may be called
// concurrently for different packages.
class Engine final {
public:
    // Without a task pool, per-file tasks run on the calling thread.
    Engine(std::shared_ptr<const Workflow> workflow, Store& store, TaskExecutor& executor,
           Pool* taskPool = nullptr) noexcept;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    // Advance the package until it is terminal or a stop is requested.
    // A terminal package is left untouched and its status returned.
    [[nodiscard]] PackageStatus run(const PackageId& id) noexcept;

    // Packages in flight stop between links and stay PROCESSING.
    void requestStop() noexcept { stop_.store(true); }
    [[nodiscard]] bool stopRequested() const noexcept { return stop_.load(); }

private:
    // Next thing to do for a package.
    struct Cursor {
        LinkId link;
        LinkId origin;
        std::optional<JobRecord> resume;
        std::optional<Outcome> outcome;
        FailureDetail failure;
    };

    // What executing one link decided.
    struct Step {
        std::optional<int> exitCode;
        Route route;
        FailureDetail failure;
    };

    [[nodiscard]] Cursor resumePoint(const PackageId& id) const;
    [[nodiscard]] Step execute(const PackageRecord& package, const Link& link, const JobRecord& job);
    [[nodiscard]] Step decide(const PackageRecord& package, const Link& link) const;
    [[nodiscard]] Step setVariable(const PackageRecord& package, const Link& link, const SetVariableAction& action);
    [[nodiscard]] Step runTool(const PackageRecord& package, const Link& link, const RunAction& action,
                               const JobRecord& job);

    [[nodiscard]] std::vector<std::string> enumerateFiles(const PackageRecord& package,
                                                          const RunAction& action) const;
    [[nodiscard]] Replacements packageReplacements(const PackageRecord& package) const;
    [[nodiscard]] Replacements fileReplacements(const PackageRecord& package, const FileEntry& file) const;

    [[nodiscard]] PackageStatus finish(const PackageId& id, PackageStatus status, const FailureDetail& failure);
    [[nodiscard]] PackageStatus fail(const PackageId& id, const JobRecord* job, FailureKind kind,
                                     const std::string& message);

    std::shared_ptr<const Workflow> workflow_;
    Store& store_;
    TaskExecutor& executor_;
    Pool* taskPool_;
    std::atomic<bool> stop_{false};
};

}
