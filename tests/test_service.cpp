/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/service.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace archivist;

namespace {

std::filesystem::path makeSource(const test::TempDir& dir) {
    auto source = dir.path() / "source";
    test::writeText(source / "letter.txt", "Dear archivist");
    test::writeText(source / "images" / "scan.tif", "II*");
    return source;
}

std::size_t entries(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::distance(std::filesystem::directory_iterator(dir), std::filesystem::directory_iterator()));
}

PackageId storedPackage(Store& store, const std::string& name) {
    PackageRecord record;
    record.id = generateId();
    record.name = name;
    record.sourceLocation = "/data/" + name;
    record.createdAt = Clock::now();
    EXPECT_TRUE(store.createPackage(record));
    return record.id;
}

}

TEST(service, submit_publishes_package) {
    // arrange
    test::TempDir dir;
    auto source = makeSource(dir);
    Service service(dir.path() / "ws");

    // act
    auto result = service.submit("letters", source.string(), nlohmann::json{{"normalize", false}});

    // assert
    ASSERT_TRUE(result) << result.message;
    auto staged = dir.path() / "ws" / "intake" / "ready" / result.id;
    EXPECT_TRUE(std::filesystem::is_regular_file(staged / "package.json"));
    EXPECT_EQ(readFile(staged / "work" / "objects" / "letter.txt").value_or(""), "Dear archivist");
    EXPECT_TRUE(std::filesystem::is_regular_file(staged / "work" / "objects" / "images" / "scan.tif"));
    EXPECT_EQ(entries(dir.path() / "ws" / "intake" / "writing"), 0u);

    auto record = PackageRecord::load(staged / "package.json");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "letters");
    EXPECT_FALSE(record->config.normalize);
    EXPECT_TRUE(record->config.identifyTransfer);
}

TEST(service, submit_accepts_file_url) {
    // arrange
    test::TempDir dir;
    auto source = makeSource(dir);
    Service service(dir.path() / "ws");

    // act
    auto result = service.submit("letters", "file://" + source.string(), nlohmann::json());

    // assert
    EXPECT_TRUE(result) << result.message;
    EXPECT_EQ(resolveSourceLocation("file://" + source.string()).string(), source.string());
}

TEST(service, invalid_submissions_create_nothing) {
    // arrange
    test::TempDir dir;
    auto source = makeSource(dir);
    Service service(dir.path() / "ws");

    // act
    auto noName = service.submit("  ", source.string(), nlohmann::json());
    auto noSource = service.submit("letters", (dir.path() / "missing").string(), nlohmann::json());
    auto unknownOption = service.submit("letters", source.string(), nlohmann::json{{"colour", true}});
    auto wrongType = service.submit("letters", source.string(), nlohmann::json{{"normalize", "yes"}});

    // assert
    EXPECT_FALSE(noName);
    EXPECT_EQ(noName.error, SubmissionError::InvalidName);
    EXPECT_FALSE(noSource);
    EXPECT_EQ(noSource.error, SubmissionError::InvalidSource);
    EXPECT_FALSE(unknownOption);
    EXPECT_EQ(unknownOption.error, SubmissionError::InvalidConfig);
    EXPECT_NE(unknownOption.message.find("colour"), std::string::npos);
    EXPECT_FALSE(wrongType);
    EXPECT_EQ(wrongType.error, SubmissionError::InvalidConfig);

    EXPECT_EQ(entries(dir.path() / "ws" / "intake" / "ready"), 0u);
    EXPECT_EQ(entries(dir.path() / "ws" / "intake" / "writing"), 0u);
    EXPECT_EQ(entries(dir.path() / "ws" / "packages"), 0u);
}

TEST(service, missing_workspace_is_not_created_for_readers) {
    // arrange
    test::TempDir dir;
    auto workspace = dir.path() / "absent";

    // act
    Service service(workspace, false);
    auto result = service.submit("letters", dir.path().string(), nlohmann::json());

    // assert
    EXPECT_FALSE(service.isReady());
    EXPECT_FALSE(std::filesystem::exists(workspace));
    EXPECT_EQ(result.error, SubmissionError::WorkspaceError);
}

TEST(service, read_unknown_package_is_nullopt) {
    // arrange
    test::TempDir dir;
    Service service(dir.path());

    // act & assert
    EXPECT_FALSE(service.read("20250101T000000_000000_unknown").has_value());
    EXPECT_FALSE(service.read("").has_value());
    EXPECT_FALSE(service.read("../packages").has_value());
}

TEST(service, unclaimed_package_reads_as_processing) {
    // arrange
    test::TempDir dir;
    auto source = makeSource(dir);
    Service service(dir.path() / "ws");
    auto result = service.submit("letters", source.string(), nlohmann::json());
    ASSERT_TRUE(result);

    // act
    auto view = service.read(result.id);

    // assert
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->id, result.id);
    EXPECT_EQ(view->name, "letters");
    EXPECT_EQ(view->status, PackageStatus::Processing);
    EXPECT_TRUE(view->jobs.empty());
    EXPECT_FALSE(view->currentJob.has_value());
}

TEST(service, read_lists_jobs_and_current_job) {
    // arrange
    test::TempDir dir;
    Service service(dir.path());
    Store store(dir.path());
    auto id = storedPackage(store, "letters");
    JobRecord draft;
    draft.packageId = id;
    draft.name = "Verify objects";
    draft.group = "Verify";
    draft.linkId = "verify";
    auto first = store.createJob(draft);
    ASSERT_TRUE(first.has_value());
    first->status = JobStatus::Complete;
    first->nextLink = "checksum";
    first->endTime = Clock::now();
    ASSERT_TRUE(store.finishJob(*first));
    draft.linkId = "checksum";
    draft.originLink = "verify";
    auto second = store.createJob(draft);
    ASSERT_TRUE(second.has_value());

    // act
    auto view = service.read(id);

    // assert
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->status, PackageStatus::Processing);
    ASSERT_EQ(view->jobs.size(), 2u);
    EXPECT_EQ(view->jobs[0].status, JobStatus::Complete);
    EXPECT_EQ(view->jobs[1].originLink, "verify");
    EXPECT_EQ(view->currentJob, second->id);

    auto doc = toJson(*view);
    EXPECT_EQ(doc["status"].get<std::string>(), "PROCESSING");
    EXPECT_EQ(doc["current_job"].get<std::string>(), second->id);
    EXPECT_EQ(doc["jobs"].size(), 2u);
    EXPECT_EQ(doc["jobs"][1]["link_id"].get<std::string>(), "checksum");
    EXPECT_FALSE(doc.contains("failure"));
}

TEST(service, read_reports_failure_detail) {
    // arrange
    test::TempDir dir;
    Service service(dir.path());
    Store store(dir.path());
    auto id = storedPackage(store, "letters");
    ASSERT_TRUE(store.finishPackage(id, PackageStatus::Failed, {FailureKind::Configuration, "Unknown link: gone"}));

    // act
    auto view = service.read(id);

    // assert
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->status, PackageStatus::Failed);
    auto doc = toJson(*view);
    EXPECT_EQ(doc["failure"]["kind"].get<std::string>(), "configuration");
    EXPECT_EQ(doc["failure"]["message"].get<std::string>(), "Unknown link: gone");
    EXPECT_TRUE(doc["current_job"].is_null());
}

TEST(service, list_tasks_of_unknown_job_is_empty) {
    // arrange
    test::TempDir dir;
    Service service(dir.path());

    // act & assert
    EXPECT_TRUE(service.listTasks("no_such_job").empty());
}

TEST(service, list_tasks_returns_recorded_tasks) {
    // arrange
    test::TempDir dir;
    Service service(dir.path());
    Store store(dir.path());
    auto id = storedPackage(store, "letters");
    JobRecord draft;
    draft.packageId = id;
    draft.linkId = "checksum";
    auto job = store.createJob(draft);
    ASSERT_TRUE(job.has_value());
    TaskRecord task;
    task.fileId = "f1";
    task.filename = "objects/letter.txt";
    task.execution = "sha256sum";
    task.startTime = Clock::now();
    ASSERT_EQ(store.createTask(*job, task), ClaimResult::Created);
    task.exitCode = 0;
    task.stdoutText = "abc  letter.txt\n";
    task.endTime = Clock::now();
    ASSERT_TRUE(store.completeTask(*job, task));

    // act
    auto tasks = service.listTasks(job->id);

    // assert
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].filename, "objects/letter.txt");
    EXPECT_EQ(tasks[0].execution, "sha256sum");
    EXPECT_EQ(tasks[0].exitCode, 0);
    EXPECT_EQ(tasks[0].stdoutText, "abc  letter.txt\n");
}

TEST(service, empty_purges_only_terminal_packages) {
    // arrange
    test::TempDir dir;
    Service service(dir.path());
    Store store(dir.path());
    auto running = storedPackage(store, "running");
    auto complete = storedPackage(store, "complete");
    auto rejected = storedPackage(store, "rejected");
    ASSERT_TRUE(store.finishPackage(complete, PackageStatus::Complete, {}));
    ASSERT_TRUE(store.finishPackage(rejected, PackageStatus::Rejected, {FailureKind::Tool, "bad"}));

    // act
    auto first = service.empty();
    auto second = service.empty();

    // assert
    EXPECT_EQ(first, 2u);
    EXPECT_EQ(second, 0u);
    EXPECT_TRUE(std::filesystem::exists(store.workDirectory(running)));
    EXPECT_FALSE(std::filesystem::exists(store.workDirectory(complete)));
    EXPECT_FALSE(std::filesystem::exists(store.workDirectory(rejected)));

    auto view = service.read(complete);
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->status, PackageStatus::Complete);
    EXPECT_EQ(service.read(running)->status, PackageStatus::Processing);
}
