/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/store.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace archivist;

namespace {

PackageRecord newPackage(const std::string& name = "letters") {
    PackageRecord record;
    record.id = generateId();
    record.name = name;
    record.sourceLocation = "/data/" + name;
    record.createdAt = Clock::now();
    return record;
}

JobRecord draftJob(const PackageId& packageId, const LinkId& linkId) {
    JobRecord job;
    job.packageId = packageId;
    job.linkId = linkId;
    job.name = linkId;
    job.group = "Test";
    return job;
}

}

TEST(store, package_record_round_trip) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    record.config.normalize = false;
    record.variables["aipName"] = "letters-1";

    // act
    ASSERT_TRUE(store.createPackage(record));
    auto loaded = store.package(record.id);

    // assert
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name, "letters");
    EXPECT_EQ(loaded->status, PackageStatus::Processing);
    EXPECT_FALSE(loaded->config.normalize);
    EXPECT_EQ(loaded->variables.at("aipName"), "letters-1");
    EXPECT_TRUE(std::filesystem::is_directory(store.workDirectory(record.id) / "objects"));
    EXPECT_EQ(store.packageIds(), std::vector<PackageId>{record.id});
}

TEST(store, unknown_package_is_unspecified) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());

    // act & assert
    EXPECT_FALSE(store.package("missing").has_value());
    EXPECT_EQ(store.packageStatus("missing"), PackageStatus::Unspecified);
    EXPECT_FALSE(store.createJob(draftJob("missing", "link")).has_value());
}

TEST(store, package_status_is_monotonic) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));

    // act
    bool first = store.finishPackage(record.id, PackageStatus::Rejected, {FailureKind::Tool, "rejected"});
    bool second = store.finishPackage(record.id, PackageStatus::Complete, {});

    // assert
    EXPECT_TRUE(first);
    EXPECT_FALSE(second);
    auto loaded = store.package(record.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, PackageStatus::Rejected);
    EXPECT_EQ(loaded->failure.kind, FailureKind::Tool);
    EXPECT_TRUE(loaded->completedAt.has_value());
}

TEST(store, terminal_package_refuses_new_jobs_and_variables) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));
    ASSERT_TRUE(store.finishPackage(record.id, PackageStatus::Failed, {FailureKind::Configuration, "bad"}));

    // act
    auto job = store.createJob(draftJob(record.id, "after"));
    bool variable = store.setVariable(record.id, "x", "y");

    // assert
    EXPECT_FALSE(job.has_value());
    EXPECT_FALSE(variable);
    EXPECT_TRUE(store.jobs(record.id).empty());
}

TEST(store, jobs_listed_in_creation_order) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));

    // act
    std::vector<JobId> created;
    for (const char* link : {"c", "a", "b"}) {
        auto job = store.createJob(draftJob(record.id, link));
        ASSERT_TRUE(job.has_value());
        created.push_back(job->id);
    }
    auto jobs = store.jobs(record.id);

    // assert
    ASSERT_EQ(jobs.size(), 3u);
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        EXPECT_EQ(jobs[i].id, created[i]);
        EXPECT_EQ(jobs[i].sequence, i);
        EXPECT_EQ(jobs[i].status, JobStatus::Processing);
    }
    EXPECT_EQ(jobs[0].linkId, "c");
}

TEST(store, job_finishes_once) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));
    auto job = store.createJob(draftJob(record.id, "check"));
    ASSERT_TRUE(job.has_value());

    // act
    job->status = JobStatus::Complete;
    job->exitCode = 0;
    job->nextLink = "next";
    job->endTime = Clock::now();
    bool first = store.finishJob(*job);
    job->status = JobStatus::Failed;
    bool second = store.finishJob(*job);

    // assert
    EXPECT_TRUE(first);
    EXPECT_FALSE(second);
    auto stored = store.job(job->id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, JobStatus::Complete);
    EXPECT_EQ(stored->nextLink, "next");
    EXPECT_EQ(stored->exitCode, 0);
}

TEST(store, finish_job_rejects_processing_status) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));
    auto job = store.createJob(draftJob(record.id, "check"));
    ASSERT_TRUE(job.has_value());

    // act & assert
    EXPECT_FALSE(store.finishJob(*job));
}

TEST(store, job_lookup_from_fresh_store) {
    // arrange
    test::TempDir dir;
    auto record = newPackage();
    JobId jobId;
    {
        Store writer(dir.path());
        ASSERT_TRUE(writer.createPackage(record));
        auto job = writer.createJob(draftJob(record.id, "check"));
        ASSERT_TRUE(job.has_value());
        jobId = job->id;
    }

    // act
    Store reader(dir.path());
    auto job = reader.job(jobId);

    // assert
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->packageId, record.id);
    EXPECT_FALSE(reader.job("no_such_job").has_value());
}

TEST(store, finished_package_jobs_stay_addressable) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));
    auto job = store.createJob(draftJob(record.id, "check"));
    ASSERT_TRUE(job.has_value());
    TaskRecord task;
    task.fileId = "f1";
    ASSERT_EQ(store.createTask(*job, task), ClaimResult::Created);
    task.exitCode = 0;
    ASSERT_TRUE(store.completeTask(*job, task));
    job->status = JobStatus::Complete;
    job->endTime = Clock::now();
    ASSERT_TRUE(store.finishJob(*job));

    // act
    bool finished = store.finishPackage(record.id, PackageStatus::Complete, {});
    auto found = store.job(job->id);
    auto tasks = store.tasks(job->id);

    // assert
    EXPECT_TRUE(finished);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->packageId, record.id);
    EXPECT_EQ(found->status, JobStatus::Complete);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].fileId, "f1");
}

TEST(store, sequences_continue_from_disk_after_finish) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));
    auto first = store.createJob(draftJob(record.id, "check"));
    ASSERT_TRUE(first.has_value());
    TaskRecord a;
    a.fileId = "f1";
    TaskRecord b;
    b.fileId = "f2";
    ASSERT_EQ(store.createTask(*first, a), ClaimResult::Created);
    ASSERT_EQ(store.createTask(*first, b), ClaimResult::Created);
    first->status = JobStatus::Complete;
    first->endTime = Clock::now();
    ASSERT_TRUE(store.finishJob(*first));

    // act
    TaskRecord late;
    late.fileId = "f3";
    auto claimed = store.createTask(*first, late);
    auto second = store.createJob(draftJob(record.id, "store"));

    // assert
    EXPECT_EQ(claimed, ClaimResult::Created);
    EXPECT_EQ(late.sequence, 2u);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->sequence, 1u);
    EXPECT_EQ(store.job(second->id)->linkId, "store");
}

TEST(store, task_claim_is_exclusive_under_concurrency) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));
    auto job = store.createJob(draftJob(record.id, "checksum"));
    ASSERT_TRUE(job.has_value());

    std::atomic<int> created{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;

    // act
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            TaskRecord task;
            task.fileId = "file-1";
            task.filename = "objects/a.txt";
            task.startTime = Clock::now();
            switch (store.createTask(*job, task)) {
                case ClaimResult::Created: ++created; break;
                case ClaimResult::Duplicate: ++duplicates; break;
                default: break;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // assert
    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(duplicates.load(), 7);
    EXPECT_EQ(store.tasks(*job).size(), 1u);
}

TEST(store, task_completes_once_and_lists_in_order) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));
    auto job = store.createJob(draftJob(record.id, "checksum"));
    ASSERT_TRUE(job.has_value());

    std::vector<TaskRecord> claimed;
    for (const char* fileId : {"f2", "f1", "f3"}) {
        TaskRecord task;
        task.fileId = fileId;
        task.startTime = Clock::now();
        ASSERT_EQ(store.createTask(*job, task), ClaimResult::Created);
        claimed.push_back(task);
    }

    // act
    claimed[0].exitCode = 3;
    claimed[0].stdoutText = "out";
    claimed[0].endTime = Clock::now();
    bool first = store.completeTask(*job, claimed[0]);
    bool again = store.completeTask(*job, claimed[0]);
    auto tasks = store.tasks(job->id);

    // assert
    EXPECT_TRUE(first);
    EXPECT_FALSE(again);
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(tasks[0].fileId, "f2");
    EXPECT_EQ(tasks[0].exitCode, 3);
    EXPECT_EQ(tasks[0].stdoutText, "out");
    EXPECT_EQ(tasks[1].fileId, "f1");
    EXPECT_FALSE(tasks[1].completed());
    EXPECT_EQ(tasks[2].fileId, "f3");
}

TEST(store, file_ids_are_stable) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));

    // act
    auto first = store.registerFiles(record.id, {"objects/b.txt", "objects/a.txt"});
    auto second = store.registerFiles(record.id, {"objects/c.txt", "objects/a.txt", "objects/b.txt"});

    // assert
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(first->size(), 2u);
    ASSERT_EQ(second->size(), 3u);
    EXPECT_EQ((*first)[0].path, "objects/a.txt");
    EXPECT_EQ((*second)[0].id, (*first)[0].id);
    EXPECT_EQ((*second)[1].id, (*first)[1].id);
    EXPECT_LT((*first)[0].id, (*first)[1].id);
    EXPECT_EQ(store.files(record.id).size(), 3u);
}

TEST(store, file_registry_keeps_raw_names) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto record = newPackage();
    ASSERT_TRUE(store.createPackage(record));
    const std::string latin1 = "objects/caf\xE9.txt";
    const std::string percent = "objects/100%25 done.txt";

    // act
    auto first = store.registerFiles(record.id, {latin1, percent, "objects/plain.txt"});
    Store reopened(dir.path());
    auto again = reopened.registerFiles(record.id, {percent, latin1});
    auto raw = readFile(store.packageDirectory(record.id) / "files.json");

    // assert
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(again.has_value());
    ASSERT_EQ(again->size(), 2u);
    for (const auto& entry : *again) {
        auto match = std::find_if(first->begin(), first->end(),
                                  [&](const FileEntry& other) { return other.path == entry.path; });
        ASSERT_NE(match, first->end());
        EXPECT_EQ(match->id, entry.id);
    }
    EXPECT_EQ(reopened.files(record.id).size(), 3u);
    ASSERT_TRUE(raw.has_value());
    EXPECT_NO_THROW((void)nlohmann::json::parse(*raw));
}

TEST(store, purge_only_terminal_packages) {
    // arrange
    test::TempDir dir;
    Store store(dir.path());
    auto running = newPackage("running");
    auto done = newPackage("done");
    ASSERT_TRUE(store.createPackage(running));
    ASSERT_TRUE(store.createPackage(done));
    ASSERT_TRUE(store.finishPackage(done.id, PackageStatus::Complete, {}));

    // act
    bool purgedRunning = store.purgeWorkDirectory(running.id);
    bool purgedDone = store.purgeWorkDirectory(done.id);
    bool purgedAgain = store.purgeWorkDirectory(done.id);

    // assert
    EXPECT_FALSE(purgedRunning);
    EXPECT_TRUE(purgedDone);
    EXPECT_FALSE(purgedAgain);
    EXPECT_TRUE(std::filesystem::exists(store.workDirectory(running.id)));
    EXPECT_FALSE(std::filesystem::exists(store.workDirectory(done.id)));
    auto record = store.package(done.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->purged);
    EXPECT_EQ(record->status, PackageStatus::Complete);
}
