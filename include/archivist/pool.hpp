/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace archivist {

using WorkItem = std::function<void(int workerId)>;

class Pool {
public:
    Pool(int workers, std::string name) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start();
    // Finishes running items; queued ones are dropped.
    void stop() noexcept;
    [[nodiscard]] bool submit(WorkItem item) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void workerLoop(int workerId);

    int workers_;
    std::string name_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable itemAvailable_;
    std::queue<WorkItem> queue_;

    std::vector<std::thread> workerThreads_;
};

// Join barrier: wait() returns once done() balanced every add().
class WaitGroup {
public:
    WaitGroup() = default;

    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    void add(std::size_t count = 1) noexcept;
    void done() noexcept;
    void wait();

private:
    std::mutex mutex_;
    std::condition_variable zero_;
    std::size_t pending_ = 0;
};

}
