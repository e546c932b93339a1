/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace archivist {

// Opaque identifiers (time-ordered strings, see generateId()).
using PackageId = std::string;
using JobId = std::string;
using TaskId = std::string;
using FileId = std::string;
using LinkId = std::string;
using ChainId = std::string;

// Package lifecycle. Values match the service contract.
enum class PackageStatus : std::uint8_t {
    Unspecified = 0,
    Failed = 1,
    Rejected = 2,
    Complete = 3,
    Processing = 4
};

enum class JobStatus : std::uint8_t {
    Unspecified = 0,
    Complete = 1,
    Processing = 2,
    Failed = 3
};

// Terminal outcome a routing entry can name instead of a next link.
enum class Outcome : std::uint8_t { Complete, Fail, Reject };

// Why a package or job failed. Tool failures are routed by the workflow;
// the other two never consult routing.
enum class FailureKind : std::uint8_t { None, Tool, Configuration, Infrastructure };

[[nodiscard]] inline bool isTerminal(PackageStatus status) noexcept {
    return status == PackageStatus::Complete || status == PackageStatus::Failed ||
           status == PackageStatus::Rejected;
}

[[nodiscard]] const char* toString(PackageStatus status) noexcept;
[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(Outcome outcome) noexcept;
[[nodiscard]] const char* toString(FailureKind kind) noexcept;

[[nodiscard]] std::optional<PackageStatus> parsePackageStatus(const std::string& value) noexcept;
[[nodiscard]] std::optional<JobStatus> parseJobStatus(const std::string& value) noexcept;
[[nodiscard]] std::optional<Outcome> parseOutcome(const std::string& value) noexcept;
[[nodiscard]] std::optional<FailureKind> parseFailureKind(const std::string& value) noexcept;

}
