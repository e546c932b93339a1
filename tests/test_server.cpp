/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/server.hpp"
#include "archivist/service.hpp"
#include "archivist/workflow.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace archivist;

namespace {

std::shared_ptr<const Workflow> verifyWorkflow() {
    return Workflow::parse(nlohmann::json::parse(R"({
        "version": 1,
        "entry_chain": "main",
        "chains": {"main": {"links": ["verify", "nonempty", "done"]}},
        "links": {
            "verify": {
                "group": "Verify",
                "action": {"type": "run", "command": "test", "arguments": "-d %SIPObjectsDirectory%"},
                "exit_codes": {"0": {"link": "nonempty"}},
                "fallback": {"outcome": "fail"}
            },
            "nonempty": {
                "group": "Verify",
                "action": {"type": "run", "command": "test", "arguments": "-s %inputFile%", "scope": "files"},
                "exit_codes": {"0": {"link": "done"}, "1": {"outcome": "reject"}},
                "fallback": {"outcome": "fail"}
            },
            "done": {
                "action": {"type": "noop"},
                "fallback": {"outcome": "complete"}
            }
        }
    })"));
}

Settings testSettings(const std::filesystem::path& workspace) {
    Settings settings;
    settings.workspace = workspace;
    settings.packageWorkers = 2;
    settings.taskWorkers = 2;
    settings.scanInterval = std::chrono::milliseconds(20);
    return settings;
}

std::optional<PackageView> waitForTerminal(const Service& service, const PackageId& id) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        auto view = service.read(id);
        if (view && isTerminal(view->status)) {
            return view;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return service.read(id);
}

}

TEST(server, submitted_package_completes) {
    // arrange
    test::TempDir dir;
    auto workspace = dir.path() / "ws";
    test::writeText(dir.path() / "source" / "a.txt", "alpha");
    test::writeText(dir.path() / "source" / "nested" / "b.txt", "beta");
    Service service(workspace);
    Server server(testSettings(workspace), verifyWorkflow());
    ASSERT_TRUE(server.start());

    // act
    auto submitted = service.submit("letters", (dir.path() / "source").string(), nlohmann::json());
    ASSERT_TRUE(submitted) << submitted.message;
    auto view = waitForTerminal(service, submitted.id);
    server.shutdown();

    // assert
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->status, PackageStatus::Complete);
    ASSERT_EQ(view->jobs.size(), 3u);
    EXPECT_EQ(view->jobs[0].linkId, "verify");
    EXPECT_EQ(view->jobs[1].linkId, "nonempty");
    EXPECT_EQ(view->jobs[2].linkId, "done");

    auto tasks = service.listTasks(view->jobs[1].id);
    ASSERT_EQ(tasks.size(), 2u);
    for (const auto& task : tasks) {
        EXPECT_EQ(task.exitCode, 0);
        EXPECT_FALSE(task.fileId.empty());
    }
    EXPECT_FALSE(std::filesystem::exists(workspace / "intake" / "ready" / submitted.id));
}

TEST(server, empty_file_rejects_package) {
    // arrange
    test::TempDir dir;
    auto workspace = dir.path() / "ws";
    test::writeText(dir.path() / "source" / "a.txt", "alpha");
    test::writeText(dir.path() / "source" / "empty.txt", "");
    Service service(workspace);
    Server server(testSettings(workspace), verifyWorkflow());
    ASSERT_TRUE(server.start());

    // act
    auto submitted = service.submit("letters", (dir.path() / "source").string(), nlohmann::json());
    ASSERT_TRUE(submitted) << submitted.message;
    auto view = waitForTerminal(service, submitted.id);
    server.shutdown();

    // assert
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->status, PackageStatus::Rejected);
    ASSERT_EQ(view->jobs.size(), 2u);
    EXPECT_EQ(view->failure.kind, FailureKind::Tool);
}

TEST(server, resumes_claimed_package_on_start) {
    // arrange
    test::TempDir dir;
    auto workspace = dir.path() / "ws";
    ASSERT_TRUE(createWorkspaceLayout(workspace));
    std::filesystem::create_directories(workspace / "intake" / "writing" / "half_written");

    Store store(workspace);
    PackageRecord record;
    record.id = generateId();
    record.name = "interrupted";
    record.sourceLocation = "/data/interrupted";
    record.createdAt = Clock::now();
    ASSERT_TRUE(store.createPackage(record));
    test::writeText(store.workDirectory(record.id) / "objects" / "a.txt", "alpha");

    JobRecord draft;
    draft.packageId = record.id;
    draft.linkId = "verify";
    draft.name = "verify";
    auto verified = store.createJob(draft);
    ASSERT_TRUE(verified.has_value());
    verified->status = JobStatus::Complete;
    verified->exitCode = 0;
    verified->nextLink = "nonempty";
    verified->endTime = Clock::now();
    ASSERT_TRUE(store.finishJob(*verified));

    Service service(workspace, false);
    Server server(testSettings(workspace), verifyWorkflow());

    // act
    ASSERT_TRUE(server.start());
    auto view = waitForTerminal(service, record.id);
    server.shutdown();

    // assert
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->status, PackageStatus::Complete);
    ASSERT_EQ(view->jobs.size(), 3u);
    EXPECT_EQ(view->jobs[0].id, verified->id);
    EXPECT_EQ(view->jobs[1].originLink, "verify");
    EXPECT_FALSE(std::filesystem::exists(workspace / "intake" / "writing" / "half_written"));
}

TEST(server, start_and_shutdown_are_guarded) {
    // arrange
    test::TempDir dir;
    Server server(testSettings(dir.path() / "ws"), verifyWorkflow());
    Server missingWorkflow(testSettings(dir.path() / "other"), nullptr);

    // act & assert
    EXPECT_FALSE(missingWorkflow.start());
    EXPECT_TRUE(server.start());
    EXPECT_TRUE(server.isRunning());
    EXPECT_FALSE(server.start());
    server.shutdown();
    EXPECT_FALSE(server.isRunning());
    server.shutdown();
    EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "ws" / "intake" / "ready"));
}
