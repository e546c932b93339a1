/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/pool.hpp"
#include "archivist/logger.hpp"
#include <utility>

namespace archivist {

Pool::Pool(int workers, std::string name) noexcept
    : workers_(workers > 0 ? workers : 1), name_(std::move(name)) {
    LOG_DEBUG("Pool '" + name_ + "' created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool '" + name_ + "' already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_INFO("Pool '" + name_ + "' started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool '" + name_ + "': " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool '" + name_ + "'...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    itemAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = queue_.size();
        std::queue<WorkItem>().swap(queue_);
    }
    if (dropped > 0) {
        LOG_DEBUG("Pool '" + name_ + "' dropped " + std::to_string(dropped) + " queued items");
    }

    LOG_INFO("Pool '" + name_ + "' stopped");
}

bool Pool::submit(WorkItem item) noexcept {
    if (!item) {
        LOG_ERROR("Invalid work item submitted to pool '" + name_ + "'");
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit to stopped pool '" + name_ + "'");
                return false;
            }
            queue_.push(std::move(item));
        }
        itemAvailable_.notify_one();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue work on pool '" + name_ + "': " + e.what());
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName(workerThreadName(name_, workerId));
    LOG_DEBUG("Worker thread started");

    while (true) {
        WorkItem item;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            itemAvailable_.wait(lock, [this] { return !queue_.empty() || shutdown_.load(); });

            if (shutdown_.load()) {
                break;
            }
            item = std::move(queue_.front());
            queue_.pop();
        }

        try {
            item(workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Work item failed on " + workerThreadName(name_, workerId) + ": " + e.what());
        } catch (...) {
            LOG_ERROR("Work item failed on " + workerThreadName(name_, workerId) + " with an unknown error");
        }
    }

    LOG_DEBUG("Worker thread stopped");
}

void WaitGroup::add(std::size_t count) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ += count;
}

void WaitGroup::done() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_ > 0 && --pending_ == 0) {
        zero_.notify_all();
    }
}

void WaitGroup::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    zero_.wait(lock, [this] { return pending_ == 0; });
}

}
