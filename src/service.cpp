/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/service.hpp"
#include "archivist/logger.hpp"

namespace archivist {

nlohmann::json toJson(const PackageView& view) {
    nlohmann::json jobs = nlohmann::json::array();
    for (const auto& job : view.jobs) {
        jobs.push_back({
            {"id", job.id},
            {"name", job.name},
            {"group", job.group},
            {"link_id", job.linkId},
            {"origin_link", job.originLink},
            {"status", toString(job.status)},
            {"start_time", formatTimestamp(job.startTime)},
        });
    }

    nlohmann::json doc = {
        {"id", view.id},
        {"name", view.name},
        {"status", toString(view.status)},
        {"current_job", view.currentJob ? nlohmann::json(*view.currentJob) : nlohmann::json()},
        {"jobs", jobs},
    };
    if (view.failure.kind != FailureKind::None) {
        doc["failure"] = {{"kind", toString(view.failure.kind)}, {"message", view.failure.message}};
    }
    return doc;
}

Service::Service(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace), work_(workspace, createIfMissing), store_(workspace) {
    LOG_DEBUG("Service created for workspace: " + workspace_.string());
}

SubmitResult Service::submit(const std::string& name, const std::string& sourceLocation,
                             const nlohmann::json& config) {
    return work_.submit(name, sourceLocation, config);
}

SubmitResult Service::submit(const std::string& name, const std::string& sourceLocation,
                             const ProcessingConfig& config) {
    return work_.submit(name, sourceLocation, config);
}

std::optional<PackageView> Service::read(const PackageId& id) const noexcept {
    if (id.empty() || id.find('/') != std::string::npos) {
        return std::nullopt;
    }

    try {
        auto record = store_.package(id);
        if (!record) {
            if (auto published = readPublished(id)) {
                return published;
            }
            // Claimed between the two lookups
            record = store_.package(id);
        }
        if (!record) {
            LOG_DEBUG("Unknown package: " + id);
            return std::nullopt;
        }

        PackageView view;
        view.id = record->id;
        view.name = record->name;
        view.status = record->status;
        view.failure = record->failure;
        for (const auto& job : store_.jobs(id)) {
            view.jobs.push_back({job.id, job.name, job.group, job.linkId, job.originLink, job.status, job.startTime});
        }
        if (!view.jobs.empty()) {
            view.currentJob = view.jobs.back().id;
        }
        return view;
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading package " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<PackageView> Service::readPublished(const PackageId& id) const noexcept {
    auto record = PackageRecord::load(workspace_ / "intake" / "ready" / id / "package.json");
    if (!record) {
        return std::nullopt;
    }
    PackageView view;
    view.id = record->id;
    view.name = record->name;
    view.status = PackageStatus::Processing;
    return view;
}

std::vector<TaskRecord> Service::listTasks(const JobId& jobId) const noexcept {
    auto job = store_.job(jobId);
    if (!job) {
        LOG_DEBUG("Unknown job: " + jobId);
        return {};
    }
    return store_.tasks(*job);
}

std::size_t Service::empty() noexcept {
    std::size_t purged = 0;
    for (const auto& id : store_.packageIds()) {
        auto record = store_.package(id);
        if (!record || !isTerminal(record->status) || record->purged) {
            continue;
        }
        if (store_.purgeWorkDirectory(id)) {
            ++purged;
        }
    }
    LOG_INFO("Emptied " + std::to_string(purged) + " package(s)");
    return purged;
}

}
