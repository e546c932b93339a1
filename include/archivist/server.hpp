/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "archivist/executor.hpp"
#include "archivist/settings.hpp"
#include "archivist/types.hpp"

namespace archivist {

class Scanner;
class Pool;
class Engine;
class Store;
class Workflow;

class Server final {
public:
    // Without an executor, tools run as processes (ProcessExecutor).
    Server(Settings settings, std::shared_ptr<const Workflow> workflow,
           std::unique_ptr<TaskExecutor> executor = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return settings_.workspace; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    [[nodiscard]] std::vector<PackageId> recoverPackages() noexcept;
    [[nodiscard]] bool claim(const PackageId& id) noexcept;
    void enqueue(const PackageId& id) noexcept;
    void scanLoop();

    Settings settings_;
    std::shared_ptr<const Workflow> workflow_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::mutex wakeMutex_;
    std::condition_variable wake_;

    std::unique_ptr<Store> store_;
    std::unique_ptr<TaskExecutor> executor_;
    std::unique_ptr<Pool> taskPool_;
    std::unique_ptr<Pool> packagePool_;
    std::unique_ptr<Engine> engine_;
    std::unique_ptr<Scanner> scanner_;

    std::thread scannerThread_;
};

}
