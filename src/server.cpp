/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/server.hpp"
#include "archivist/engine.hpp"
#include "archivist/logger.hpp"
#include "archivist/pool.hpp"
#include "archivist/scanner.hpp"
#include "archivist/store.hpp"
#include "archivist/work.hpp"
#include "archivist/workflow.hpp"
#include <chrono>
#include <utility>

namespace archivist {

// Note: Signal handling is done by the CLI (archivistd.cpp), not by Server class

Server::Server(Settings settings, std::shared_ptr<const Workflow> workflow, std::unique_ptr<TaskExecutor> executor)
    : settings_(std::move(settings)), workflow_(std::move(workflow)), executor_(std::move(executor)) {
    LOG_DEBUG("Server created - " + settings_.describe());
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }
    if (!workflow_) {
        LOG_ERROR("No workflow loaded");
        return false;
    }

    LOG_INFO("Starting archivist server...");

    if (!createWorkspaceLayout(settings_.workspace)) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    setThreadName("main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("archivist Server Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + settings_.workspace.string());
    LOG_DEBUG("Workflow: " + settings_.workflowPath.string() + " (" + std::to_string(workflow_->links().size()) +
              " links, entry " + workflow_->entryChain().id + ")");
    LOG_DEBUG("Package workers: " + std::to_string(settings_.packageWorkers));
    LOG_DEBUG("Task workers: " + std::to_string(settings_.taskWorkers));
    LOG_DEBUG("========================================");

    try {
        shutdown_.store(false);
        store_ = std::make_unique<Store>(settings_.workspace);
        scanner_ = std::make_unique<Scanner>(settings_.workspace);
        if (!executor_) {
            executor_ = std::make_unique<ProcessExecutor>(
                ExecutorOptions{settings_.toolsDirectory, settings_.outputLimit});
        }

        taskPool_ = std::make_unique<Pool>(settings_.taskWorkers, "task");
        packagePool_ = std::make_unique<Pool>(settings_.packageWorkers, "package");
        engine_ = std::make_unique<Engine>(workflow_, *store_, *executor_, taskPool_.get());

        if (!taskPool_->start() || !packagePool_->start()) {
            LOG_ERROR("Failed to start worker pools");
            packagePool_->stop();
            taskPool_->stop();
            return false;
        }

        running_.store(true);

        // Packages a previous run left in flight resume before new intake
        auto recovered = recoverPackages();
        for (const auto& id : recovered) {
            enqueue(id);
        }
        if (!recovered.empty()) {
            LOG_INFO("Resuming " + std::to_string(recovered.size()) + " package(s) from a previous run");
        }

        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_DEBUG("Server started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    wake_.notify_all();

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }

    // Packages in flight stop at their next link; jobs already running
    // finish first. Queued packages stay PROCESSING and resume on restart.
    if (engine_) {
        engine_->requestStop();
    }
    if (packagePool_) {
        packagePool_->stop();
    }
    if (taskPool_) {
        taskPool_->stop();
    }

    engine_.reset();
    packagePool_.reset();
    taskPool_.reset();
    scanner_.reset();
    store_.reset();

    LOG_INFO("Server shutdown complete");
}

std::vector<PackageId> Server::recoverPackages() noexcept {
    std::vector<PackageId> pending;
    try {
        // Half-written submissions were never acknowledged
        auto writing = settings_.workspace / "intake" / "writing";
        for (const auto& entry : std::filesystem::directory_iterator(writing)) {
            LOG_WARN("Removing incomplete submission: " + entry.path().filename().string());
            std::error_code ec;
            std::filesystem::remove_all(entry.path(), ec);
            if (ec) {
                LOG_ERROR("Failed to remove " + entry.path().string() + ": " + ec.message());
            }
        }

        for (const auto& id : store_->packageIds()) {
            if (store_->packageStatus(id) == PackageStatus::Processing) {
                LOG_DEBUG("Recovering package: " + id);
                pending.push_back(id);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering packages: " + std::string(e.what()));
    }
    return pending;
}

bool Server::claim(const PackageId& id) noexcept {
    std::error_code ec;
    auto target = store_->packageDirectory(id);
    if (std::filesystem::exists(target, ec)) {
        LOG_ERROR("Package already claimed, leaving intake copy in place: " + id);
        return false;
    }
    std::filesystem::rename(settings_.workspace / "intake" / "ready" / id, target, ec);
    if (ec) {
        LOG_ERROR("Failed to claim package " + id + ": " + ec.message());
        return false;
    }
    LOG_DEBUG("Claimed package: " + id);
    return true;
}

void Server::enqueue(const PackageId& id) noexcept {
    bool queued = packagePool_->submit([this, id](int) {
        PackageStatus status = engine_->run(id);
        LOG_DEBUG("Package " + id + " left the engine as " + toString(status));
    });
    if (!queued) {
        LOG_WARN("Package pool rejected " + id + "; it resumes on restart");
    }
}

void Server::scanLoop() {
    setThreadName("scanner");
    LOG_DEBUG("Scanner loop started");

    while (!shutdown_.load()) {
        try {
            int claimed = 0;
            for (const auto& id : scanner_->scan()) {
                if (shutdown_.load()) break;
                if (claim(id)) {
                    enqueue(id);
                    ++claimed;
                }
            }
            if (claimed > 0) {
                LOG_INFO("Accepted " + std::to_string(claimed) + " new package(s)");
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wake_.wait_for(lock, settings_.scanInterval, [this] { return shutdown_.load(); });
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
