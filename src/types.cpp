/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/types.hpp"

namespace archivist {

const char* toString(PackageStatus status) noexcept {
    switch (status) {
        case PackageStatus::Failed: return "FAILED";
        case PackageStatus::Rejected: return "REJECTED";
        case PackageStatus::Complete: return "COMPLETE";
        case PackageStatus::Processing: return "PROCESSING";
        default: return "UNSPECIFIED";
    }
}

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Complete: return "COMPLETE";
        case JobStatus::Processing: return "PROCESSING";
        case JobStatus::Failed: return "FAILED";
        default: return "UNSPECIFIED";
    }
}

const char* toString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Complete: return "complete";
        case Outcome::Fail: return "fail";
        case Outcome::Reject: return "reject";
    }
    return "fail";
}

const char* toString(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::Tool: return "tool";
        case FailureKind::Configuration: return "configuration";
        case FailureKind::Infrastructure: return "infrastructure";
        default: return "none";
    }
}

std::optional<PackageStatus> parsePackageStatus(const std::string& value) noexcept {
    if (value == "FAILED") return PackageStatus::Failed;
    if (value == "REJECTED") return PackageStatus::Rejected;
    if (value == "COMPLETE") return PackageStatus::Complete;
    if (value == "PROCESSING") return PackageStatus::Processing;
    if (value == "UNSPECIFIED") return PackageStatus::Unspecified;
    return std::nullopt;
}

std::optional<JobStatus> parseJobStatus(const std::string& value) noexcept {
    if (value == "COMPLETE") return JobStatus::Complete;
    if (value == "PROCESSING") return JobStatus::Processing;
    if (value == "FAILED") return JobStatus::Failed;
    if (value == "UNSPECIFIED") return JobStatus::Unspecified;
    return std::nullopt;
}

std::optional<Outcome> parseOutcome(const std::string& value) noexcept {
    if (value == "complete") return Outcome::Complete;
    if (value == "fail") return Outcome::Fail;
    if (value == "reject") return Outcome::Reject;
    return std::nullopt;
}

std::optional<FailureKind> parseFailureKind(const std::string& value) noexcept {
    if (value == "none") return FailureKind::None;
    if (value == "tool") return FailureKind::Tool;
    if (value == "configuration") return FailureKind::Configuration;
    if (value == "infrastructure") return FailureKind::Infrastructure;
    return std::nullopt;
}

}
