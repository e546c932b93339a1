/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace archivist;

TEST(pool, runs_every_item_and_joins) {
    // arrange
    Pool pool(4, "test");
    ASSERT_TRUE(pool.start());
    WaitGroup group;
    std::atomic<int> sum{0};

    // act
    for (int i = 1; i <= 100; ++i) {
        group.add();
        ASSERT_TRUE(pool.submit([&, i](int) {
            sum += i;
            group.done();
        }));
    }
    group.wait();
    pool.stop();

    // assert
    EXPECT_EQ(sum.load(), 5050);
    EXPECT_FALSE(pool.isRunning());
}

TEST(pool, bounded_worker_ids) {
    // arrange
    Pool pool(3, "ids");
    ASSERT_TRUE(pool.start());
    WaitGroup group;
    std::mutex mutex;
    std::set<int> seen;

    // act
    for (int i = 0; i < 30; ++i) {
        group.add();
        ASSERT_TRUE(pool.submit([&](int workerId) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                seen.insert(workerId);
            }
            group.done();
        }));
    }
    group.wait();

    // assert
    EXPECT_EQ(pool.workerCount(), 3);
    for (int id : seen) {
        EXPECT_GE(id, 0);
        EXPECT_LT(id, 3);
    }
}

TEST(pool, throwing_item_does_not_kill_worker) {
    // arrange
    Pool pool(1, "throw");
    ASSERT_TRUE(pool.start());
    WaitGroup group;
    bool ran = false;

    // act
    ASSERT_TRUE(pool.submit([](int) { throw std::runtime_error("boom"); }));
    group.add();
    ASSERT_TRUE(pool.submit([&](int) {
        ran = true;
        group.done();
    }));
    group.wait();

    // assert
    EXPECT_TRUE(ran);
}

TEST(pool, submit_after_stop_is_refused) {
    // arrange
    Pool pool(1, "stopped");
    ASSERT_TRUE(pool.start());
    pool.stop();

    // act & assert
    EXPECT_FALSE(pool.submit([](int) {}));
    EXPECT_FALSE(pool.submit(WorkItem{}));
}

TEST(wait_group, wait_without_work_returns) {
    // arrange
    WaitGroup group;

    // act & assert
    group.wait();
    SUCCEED();
}

TEST(wait_group, waits_for_all_done_calls) {
    // arrange
    WaitGroup group;
    std::atomic<int> finished{0};
    group.add(3);
    std::vector<std::thread> threads;

    // act
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            ++finished;
            group.done();
        });
    }
    group.wait();

    // assert
    EXPECT_EQ(finished.load(), 3);
    for (auto& thread : threads) {
        thread.join();
    }
}
