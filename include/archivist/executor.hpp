/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "archivist/util.hpp"

namespace archivist {

// Exit code recorded when a tool could not be launched or its input is gone.
constexpr int kExecutorFailureCode = -1;

// Working storage or process plumbing failed: there is no exit code to route.
class InfrastructureError : public std::runtime_error {
public:
    explicit InfrastructureError(const std::string& message) : std::runtime_error(message) {}
};

struct TaskSpec {
    std::string executable;
    std::vector<std::string> arguments;
    std::filesystem::path workingDirectory;
    std::filesystem::path inputFile;   // checked before launch when set
    std::filesystem::path stdoutFile;  // copy of captured stdout when set
    std::filesystem::path stderrFile;
};

struct TaskResult {
    int exitCode = kExecutorFailureCode;
    std::string stdoutText;
    std::string stderrText;
    TimePoint startTime;
    TimePoint endTime;
    bool truncated = false;
};

class TaskExecutor {
public:
    virtual ~TaskExecutor() = default;

    // Expected failures (nonzero exit, missing input, launch failure) are
    // reported in the result. Throws InfrastructureError only.
    [[nodiscard]] virtual TaskResult execute(const TaskSpec& spec) = 0;

    // What execute() will actually run for `command`.
    [[nodiscard]] virtual std::string resolveExecutable(const std::string& command) const { return command; }
};

struct ExecutorOptions {
    std::filesystem::path toolsDirectory;
    std::size_t outputLimit = 1024 * 1024;
};

class ProcessExecutor final : public TaskExecutor {
public:
    explicit ProcessExecutor(ExecutorOptions options = {}) noexcept;

    ProcessExecutor(const ProcessExecutor&) = delete;
    ProcessExecutor& operator=(const ProcessExecutor&) = delete;

    [[nodiscard]] TaskResult execute(const TaskSpec& spec) override;
    [[nodiscard]] std::string resolveExecutable(const std::string& command) const override;

private:
    void drain(int outFd, int errFd, TaskResult& result) const;
    void copyStream(const std::filesystem::path& target, const std::filesystem::path& workingDirectory,
                    const std::string& content) const;

    ExecutorOptions options_;
};

}
