/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/work.hpp"
#include "archivist/logger.hpp"
#include "archivist/store.hpp"
#include "archivist/util.hpp"
#include <unistd.h>

namespace archivist {

namespace {

constexpr const char* kFileScheme = "file://";

bool validateSource(const std::filesystem::path& source, std::string& error) {
    std::error_code ec;
    if (source.empty()) {
        error = "Source location is empty";
        return false;
    }
    if (!std::filesystem::exists(source, ec)) {
        error = "Source not found: " + source.string();
        return false;
    }
    if (!std::filesystem::is_directory(source, ec) && !std::filesystem::is_regular_file(source, ec)) {
        error = "Source is neither a file nor a directory: " + source.string();
        return false;
    }
    if (::access(source.c_str(), R_OK) != 0) {
        error = "Source is not readable: " + source.string();
        return false;
    }
    return true;
}

}

const char* toString(SubmissionError error) noexcept {
    switch (error) {
        case SubmissionError::None: return "none";
        case SubmissionError::InvalidName: return "invalid name";
        case SubmissionError::InvalidSource: return "invalid source";
        case SubmissionError::InvalidConfig: return "invalid configuration";
        case SubmissionError::IoError: return "i/o error";
        case SubmissionError::WorkspaceError: return "workspace error";
    }
    return "unknown";
}

std::filesystem::path resolveSourceLocation(const std::string& sourceLocation) {
    std::string location = trim(sourceLocation);
    if (location.rfind(kFileScheme, 0) == 0) {
        location.erase(0, std::char_traits<char>::length(kFileScheme));
    }
    return std::filesystem::path(location);
}

bool createWorkspaceLayout(const std::filesystem::path& workspace) noexcept {
    try {
        std::filesystem::create_directories(workspace / "intake" / "writing");
        std::filesystem::create_directories(workspace / "intake" / "ready");
        std::filesystem::create_directories(workspace / "packages");
        std::filesystem::create_directories(workspace / "completed");
        std::filesystem::create_directories(workspace / "tmp");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace " + workspace.string() + ": " + e.what());
        return false;
    }
}

Work::Work(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace) {
    std::error_code ec;
    if (!createIfMissing && !std::filesystem::exists(workspace_, ec)) {
        LOG_ERROR("Workspace does not exist: " + workspace_.string());
        return;
    }
    ready_ = createWorkspaceLayout(workspace_);
    if (!ready_) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
    }
}

SubmitResult Work::submit(const std::string& name, const std::string& sourceLocation, const nlohmann::json& config) {
    ConfigResult resolved = ProcessingConfig::fromJson(config);
    if (!resolved) {
        LOG_DEBUG("Invalid processing configuration: " + resolved.message);
        return {false, "", SubmissionError::InvalidConfig, resolved.message};
    }
    return submit(name, sourceLocation, resolved.config);
}

SubmitResult Work::submit(const std::string& name, const std::string& sourceLocation, const ProcessingConfig& config) {
    if (!ready_) {
        return {false, "", SubmissionError::WorkspaceError, "Workspace is not available: " + workspace_.string()};
    }

    if (trim(name).empty()) {
        LOG_DEBUG("Invalid package name: empty");
        return {false, "", SubmissionError::InvalidName, "Package name is empty"};
    }

    std::string error;
    if (!config.validate(error)) {
        LOG_DEBUG("Invalid processing configuration: " + error);
        return {false, "", SubmissionError::InvalidConfig, error};
    }

    auto source = resolveSourceLocation(sourceLocation);
    if (!validateSource(source, error)) {
        LOG_DEBUG(error);
        return {false, "", SubmissionError::InvalidSource, error};
    }

    PackageId id = generateId();
    LOG_DEBUG("Generated package ID: " + id);

    if (!createPackageDirectory(id)) {
        LOG_ERROR("Failed to create staging directory for: " + id);
        cleanupFailedPackage(id);
        return {false, "", SubmissionError::IoError, "Failed to create staging directory"};
    }

    if (!writePackageFile(id, name, sourceLocation, config)) {
        LOG_ERROR("Failed to write package record for: " + id);
        cleanupFailedPackage(id);
        return {false, "", SubmissionError::IoError, "Failed to write package record"};
    }

    if (!copySource(id, source)) {
        LOG_ERROR("Failed to copy source for: " + id);
        cleanupFailedPackage(id);
        return {false, "", SubmissionError::IoError, "Failed to copy source " + source.string()};
    }

    if (!atomicPublish(id)) {
        LOG_ERROR("Failed to publish package: " + id);
        cleanupFailedPackage(id);
        return {false, "", SubmissionError::IoError, "Failed to publish package"};
    }

    LOG_INFO("Package submitted successfully: " + id + " (" + name + ")");
    return {true, id, SubmissionError::None, ""};
}

std::filesystem::path Work::stagingPath(const PackageId& id) const {
    return workspace_ / "intake" / "writing" / id;
}

bool Work::createPackageDirectory(const PackageId& id) const noexcept {
    try {
        auto packagePath = stagingPath(id);
        std::filesystem::create_directories(packagePath / "jobs");
        std::filesystem::create_directories(packagePath / "work" / "objects");
        std::filesystem::create_directories(packagePath / "work" / "logs");
        std::filesystem::create_directories(packagePath / "work" / "metadata");
        return std::filesystem::is_directory(packagePath);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create " + stagingPath(id).string() + ": " + e.what());
        return false;
    }
}

bool Work::writePackageFile(const PackageId& id, const std::string& name, const std::string& sourceLocation,
                            const ProcessingConfig& config) const noexcept {
    try {
        PackageRecord record;
        record.id = id;
        record.name = trim(name);
        record.sourceLocation = sourceLocation;
        record.status = PackageStatus::Processing;
        record.config = config;
        record.createdAt = Clock::now();
        return writeFileAtomic(stagingPath(id) / "package.json", dumpJson(record.toJson(), 2));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to serialize package record: " + std::string(e.what()));
        return false;
    }
}

bool Work::copySource(const PackageId& id, const std::filesystem::path& source) const noexcept {
    try {
        auto objects = stagingPath(id) / "work" / "objects";
        std::error_code ec;
        if (std::filesystem::is_directory(source)) {
            std::filesystem::copy(source, objects,
                                  std::filesystem::copy_options::recursive |
                                      std::filesystem::copy_options::copy_symlinks,
                                  ec);
        } else {
            std::filesystem::copy_file(source, objects / source.filename(), ec);
        }
        if (ec) {
            LOG_ERROR("Copy of " + source.string() + " failed: " + ec.message());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Copy of " + source.string() + " failed: " + e.what());
        return false;
    }
}

bool Work::atomicPublish(const PackageId& id) const noexcept {
    try {
        std::error_code ec;
        std::filesystem::rename(stagingPath(id), workspace_ / "intake" / "ready" / id, ec);
        if (ec) {
            LOG_ERROR("Rename into intake/ready failed: " + ec.message());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to publish " + id + ": " + e.what());
        return false;
    }
}

void Work::cleanupFailedPackage(const PackageId& id) const noexcept {
    try {
        std::error_code ec;
        std::filesystem::remove_all(stagingPath(id), ec);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to clean up staging of " + id + ": " + e.what());
    }
}

}
