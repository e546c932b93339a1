/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/engine.hpp"
#include "archivist/executor.hpp"
#include "archivist/logger.hpp"
#include "archivist/pool.hpp"
#include "archivist/visitor.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <set>

namespace archivist {

namespace {

PackageStatus statusFor(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Complete: return PackageStatus::Complete;
        case Outcome::Reject: return PackageStatus::Rejected;
        default: return PackageStatus::Failed;
    }
}

std::string withSlash(const std::filesystem::path& dir) {
    return (dir / "").string();
}

std::string describe(const Route& route) {
    return route.isTerminal() ? std::string("outcome ") + toString(*route.outcome) : "link " + route.link;
}

// Claims (or re-enters) the task for one unit of work and runs it.
// nullopt: another worker holds the claim.
std::optional<TaskRecord> performTask(Store& store, TaskExecutor& executor, const JobRecord& job,
                                      const std::optional<TaskRecord>& existing, TaskRecord task,
                                      const TaskSpec& spec) {
    if (existing && existing->completed()) {
        return existing;
    }

    if (existing) {
        // Claimed before a restart but never completed: run it again.
        task.id = existing->id;
        task.sequence = existing->sequence;
        task.jobId = existing->jobId;
    } else {
        switch (store.createTask(job, task)) {
            case ClaimResult::Created:
                break;
            case ClaimResult::Duplicate:
                return std::nullopt;
            default:
                throw InfrastructureError("Cannot record task for job " + job.id);
        }
    }

    TaskResult result = executor.execute(spec);
    task.exitCode = result.exitCode;
    task.stdoutText = std::move(result.stdoutText);
    task.stderrText = std::move(result.stderrText);
    task.startTime = result.startTime;
    task.endTime = result.endTime;
    task.truncated = result.truncated;

    if (!store.completeTask(job, task)) {
        throw InfrastructureError("Cannot record result of task " + task.id);
    }
    return task;
}

// Releases its WaitGroup slot when the last copy of the work item is
// destroyed, whether the item ran or a stopping pool dropped it.
class Completion {
public:
    explicit Completion(WaitGroup& group) noexcept : group_(group) {}
    ~Completion() { group_.done(); }

    Completion(const Completion&) = delete;
    Completion& operator=(const Completion&) = delete;

private:
    WaitGroup& group_;
};

}

int effectiveExitCode(const std::vector<TaskRecord>& tasks, bool unanimous) {
    if (!unanimous) {
        return 0;
    }
    std::vector<const TaskRecord*> ordered;
    ordered.reserve(tasks.size());
    for (const auto& task : tasks) {
        ordered.push_back(&task);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const TaskRecord* a, const TaskRecord* b) { return a->fileId < b->fileId; });

    for (const auto* task : ordered) {
        int code = task->exitCode.value_or(kExecutorFailureCode);
        if (code != 0) {
            return code;
        }
    }
    return 0;
}

Engine::Engine(std::shared_ptr<const Workflow> workflow, Store& store, TaskExecutor& executor, Pool* taskPool) noexcept
    : workflow_(std::move(workflow)), store_(store), executor_(executor), taskPool_(taskPool) {
    LOG_DEBUG("Engine created - entry chain: " + workflow_->entryChain().id +
              (taskPool_ ? ", task pool: " + taskPool_->name() : std::string(", inline tasks")));
}

PackageStatus Engine::run(const PackageId& id) noexcept {
    try {
        LogContext context(id);
        auto package = store_.package(id);
        if (!package) {
            LOG_ERROR("Cannot run unknown package: " + id);
            return PackageStatus::Unspecified;
        }
        if (isTerminal(package->status)) {
            LOG_DEBUG("Package " + id + " is already " + toString(package->status));
            return package->status;
        }

        LOG_INFO("Processing package " + id + " (" + package->name + ")");
        Cursor cursor = resumePoint(id);

        while (true) {
            if (cursor.outcome) {
                return finish(id, statusFor(*cursor.outcome), cursor.failure);
            }
            if (stop_.load()) {
                LOG_INFO("Stopping package " + id + " before link " + cursor.link);
                return PackageStatus::Processing;
            }

            const Link* link = workflow_->find(cursor.link);
            if (link == nullptr) {
                return fail(id, nullptr, FailureKind::Configuration, "Unknown link: " + cursor.link);
            }

            JobRecord job;
            if (cursor.resume) {
                job = std::move(*cursor.resume);
                LOG_INFO("Resuming job " + job.id + " [" + link->id + "] for package " + id);
            } else {
                JobRecord draft;
                draft.packageId = id;
                draft.linkId = link->id;
                draft.name = link->description.empty() ? link->id : link->description;
                draft.group = link->group;
                draft.originLink = cursor.origin;
                if (const Chain* chain = workflow_->chainOf(link->id)) {
                    draft.chainId = chain->id;
                }

                auto created = store_.createJob(std::move(draft));
                if (!created) {
                    PackageStatus current = store_.packageStatus(id);
                    if (isTerminal(current)) {
                        return current;
                    }
                    return fail(id, nullptr, FailureKind::Infrastructure, "Cannot record job for link " + link->id);
                }
                job = std::move(*created);
            }

            package = store_.package(id);
            if (!package) {
                return fail(id, &job, FailureKind::Infrastructure, "Package record is unreadable");
            }

            Step step;
            try {
                step = execute(*package, *link, job);
            } catch (const InfrastructureError& e) {
                step.failure = {FailureKind::Infrastructure, e.what()};
            } catch (const std::exception& e) {
                LOG_ERROR("Job " + job.id + " [" + link->id + "] raised: " + e.what());
                step.failure = {FailureKind::Infrastructure, e.what()};
            }

            if (step.failure.kind != FailureKind::None) {
                job.exitCode = step.exitCode;
                return fail(id, &job, step.failure.kind, step.failure.message);
            }

            job.endTime = Clock::now();
            job.exitCode = step.exitCode;
            if (step.route.isTerminal()) {
                job.outcome = step.route.outcome;
                job.status = *step.route.outcome == Outcome::Complete ? JobStatus::Complete : JobStatus::Failed;
            } else {
                job.nextLink = step.route.link;
                job.status = JobStatus::Complete;
            }
            if (!store_.finishJob(job)) {
                return fail(id, nullptr, FailureKind::Infrastructure, "Cannot record result of job " + job.id);
            }

            LOG_INFO("Job " + job.id + " [" + link->id + "] " + toString(job.status) +
                     (job.exitCode ? " with exit code " + std::to_string(*job.exitCode) : std::string()) +
                     ", next: " + describe(step.route));

            Cursor next;
            if (step.route.isTerminal()) {
                next.outcome = step.route.outcome;
                if (*next.outcome != Outcome::Complete) {
                    next.failure.kind = FailureKind::Tool;
                    next.failure.message = "Link " + link->id + " routed to " + toString(*next.outcome) +
                                           (job.exitCode ? " on exit code " + std::to_string(*job.exitCode)
                                                         : std::string());
                }
            } else {
                next.link = step.route.link;
                next.origin = link->id;
            }
            cursor = std::move(next);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error processing package " + id + ": " + e.what());
        return fail(id, nullptr, FailureKind::Infrastructure, e.what());
    }
}

Engine::Cursor Engine::resumePoint(const PackageId& id) const {
    Cursor cursor;
    auto jobs = store_.jobs(id);
    if (jobs.empty()) {
        cursor.link = workflow_->entryLink();
        return cursor;
    }

    const JobRecord& last = jobs.back();
    if (last.status == JobStatus::Processing) {
        cursor.link = last.linkId;
        cursor.origin = last.originLink;
        cursor.resume = last;
    } else if (last.outcome) {
        cursor.outcome = last.outcome;
        if (*last.outcome != Outcome::Complete) {
            cursor.failure = {FailureKind::Tool, "Link " + last.linkId + " routed to " + toString(*last.outcome)};
        }
    } else if (!last.nextLink.empty()) {
        cursor.link = last.nextLink;
        cursor.origin = last.linkId;
    } else {
        // Job failed without routing and the package was never finished.
        cursor.outcome = Outcome::Fail;
        cursor.failure = last.error;
        if (cursor.failure.kind == FailureKind::None) {
            cursor.failure = {FailureKind::Infrastructure, "Job " + last.id + " failed without a route"};
        }
    }

    LOG_DEBUG("Package " + id + " resumes after " + std::to_string(jobs.size()) + " jobs" +
              (cursor.link.empty() ? std::string() : " at link " + cursor.link));
    return cursor;
}

Engine::Step Engine::execute(const PackageRecord& package, const Link& link, const JobRecord& job) {
    return std::visit(
        visitor{
            [&](const RunAction& action) { return runTool(package, link, action, job); },
            [&](const SetVariableAction& action) { return setVariable(package, link, action); },
            [&](const DecisionAction&) { return decide(package, link); },
            [&](const NoOpAction&) { return Step{0, link.route(0), {}}; },
        },
        link.action);
}

Engine::Step Engine::decide(const PackageRecord& package, const Link& link) const {
    const auto& action = std::get<DecisionAction>(link.action);
    Step step;

    auto value = package.config.value(action.option);
    if (!value) {
        step.failure = {FailureKind::Configuration, "Decision link " + link.id + " uses unknown option " + action.option};
        return step;
    }

    step.route = link.choose(*value);
    LOG_DEBUG("Decision " + link.id + ": " + action.option + "=" + *value + " -> " + describe(step.route));
    return step;
}

Engine::Step Engine::setVariable(const PackageRecord& package, const Link& link, const SetVariableAction& action) {
    std::string value = expand(action.value, packageReplacements(package));
    if (!store_.setVariable(package.id, action.name, value)) {
        throw InfrastructureError("Cannot store variable " + action.name);
    }
    LOG_DEBUG("Package " + package.id + " variable " + action.name + "=" + value);
    return Step{0, link.route(0), {}};
}

Engine::Step Engine::runTool(const PackageRecord& package, const Link& link, const RunAction& action,
                             const JobRecord& job) {
    const auto workDir = store_.workDirectory(package.id);
    std::error_code ec;
    if (!std::filesystem::is_directory(workDir, ec)) {
        throw InfrastructureError("Working directory unavailable: " + workDir.string());
    }

    Step step;
    const Replacements base = packageReplacements(package);

    auto buildSpec = [&](const Replacements& values, TaskSpec& spec) {
        auto arguments = expandArguments(action.arguments, values);
        if (!arguments) {
            return false;
        }
        spec.executable = expand(action.command, values);
        spec.arguments = std::move(*arguments);
        spec.workingDirectory = workDir;
        if (!action.stdoutFile.empty()) spec.stdoutFile = expand(action.stdoutFile, values);
        if (!action.stderrFile.empty()) spec.stderrFile = expand(action.stderrFile, values);
        return true;
    };

    auto draftFor = [&](const TaskSpec& spec, const FileEntry* file) {
        TaskRecord task;
        if (file != nullptr) {
            task.fileId = file->id;
            task.filename = file->path;
        }
        task.execution = executor_.resolveExecutable(spec.executable);
        task.arguments = spec.arguments;
        task.startTime = Clock::now();
        return task;
    };

    std::map<FileId, TaskRecord> existing;
    for (auto& task : store_.tasks(job)) {
        existing.emplace(task.fileId, std::move(task));
    }
    auto existingFor = [&existing](const FileId& fileId) -> std::optional<TaskRecord> {
        auto it = existing.find(fileId);
        if (it == existing.end()) return std::nullopt;
        return it->second;
    };

    if (action.scope == Scope::Package) {
        TaskSpec spec;
        if (!buildSpec(base, spec)) {
            step.failure = {FailureKind::Configuration, "Unterminated quote in arguments of link " + link.id};
            return step;
        }
        auto task = performTask(store_, executor_, job, existingFor(""), draftFor(spec, nullptr), spec);
        if (!task) {
            throw InfrastructureError("Package task of job " + job.id + " is claimed elsewhere");
        }
        step.exitCode = effectiveExitCode({*task}, true);
        step.route = link.route(*step.exitCode);
        return step;
    }

    auto entries = store_.registerFiles(package.id, enumerateFiles(package, action));
    if (!entries) {
        throw InfrastructureError("Cannot register files of package " + package.id);
    }

    std::vector<TaskSpec> specs(entries->size());
    std::set<std::filesystem::path> outputs;
    for (std::size_t i = 0; i < entries->size(); ++i) {
        const FileEntry& file = (*entries)[i];
        if (!buildSpec(fileReplacements(package, file), specs[i])) {
            step.failure = {FailureKind::Configuration, "Unterminated quote in arguments of link " + link.id};
            return step;
        }
        specs[i].inputFile = workDir / file.path;

        for (const auto* output : {&specs[i].stdoutFile, &specs[i].stderrFile}) {
            if (output->empty()) continue;
            auto resolved = (output->is_absolute() ? *output : workDir / *output).lexically_normal();
            if (!outputs.insert(resolved).second) {
                step.failure = {FailureKind::Configuration,
                                "Tasks of link " + link.id + " write the same output path " + resolved.string()};
                return step;
            }
        }
    }

    struct Slot {
        std::optional<TaskRecord> task;
        bool claimedElsewhere = false;
        std::string error;
    };
    std::vector<Slot> slots(entries->size());

    WaitGroup group;
    std::size_t dispatched = 0;
    for (std::size_t i = 0; i < entries->size(); ++i) {
        const FileEntry& file = (*entries)[i];
        auto previous = existingFor(file.id);
        if (previous && previous->completed()) {
            slots[i].task = std::move(previous);
            continue;
        }

        group.add();
        ++dispatched;
        auto completion = std::make_shared<Completion>(group);
        WorkItem item = [this, &job, &slots, &specs, &file, i, previous, completion,
                         draft = draftFor(specs[i], &file)](int) {
            try {
                slots[i].task = performTask(store_, executor_, job, previous, draft, specs[i]);
                slots[i].claimedElsewhere = !slots[i].task.has_value();
            } catch (const std::exception& e) {
                slots[i].error = e.what();
                LOG_ERROR("Task for " + file.path + " in job " + job.id + " failed: " + e.what());
            }
        };
        completion.reset();

        if (taskPool_ == nullptr || !taskPool_->submit(item)) {
            item(-1);
        }
    }

    if (dispatched > 0) {
        LOG_DEBUG("Job " + job.id + " waiting on " + std::to_string(dispatched) + " tasks");
    }
    group.wait();

    std::vector<TaskRecord> results;
    results.reserve(slots.size());
    for (std::size_t i = 0; i < slots.size(); ++i) {
        Slot& slot = slots[i];
        if (!slot.error.empty()) {
            throw InfrastructureError(slot.error);
        }
        if (slot.claimedElsewhere) {
            for (auto& task : store_.tasks(job)) {
                if (task.fileId == (*entries)[i].id && task.completed()) {
                    slot.task = std::move(task);
                    break;
                }
            }
        }
        if (!slot.task) {
            throw InfrastructureError("Task for " + (*entries)[i].path + " in job " + job.id + " did not run");
        }
        results.push_back(std::move(*slot.task));
    }

    step.exitCode = effectiveExitCode(results, action.unanimous);
    step.route = link.route(*step.exitCode);
    LOG_DEBUG("Job " + job.id + " ran " + std::to_string(results.size()) + " file tasks, effective code " +
              std::to_string(*step.exitCode));
    return step;
}

std::vector<std::string> Engine::enumerateFiles(const PackageRecord& package, const RunAction& action) const {
    std::vector<std::string> paths;
    const auto workDir = store_.workDirectory(package.id);
    const auto root = workDir / action.filterSubdir;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        LOG_DEBUG("No " + action.filterSubdir + " directory in package " + package.id);
        return paths;
    }

    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            paths.push_back(it->path().lexically_relative(workDir).generic_string());
        }
    }
    if (ec) {
        throw InfrastructureError("Cannot enumerate " + root.string() + ": " + ec.message());
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

Replacements Engine::packageReplacements(const PackageRecord& package) const {
    const auto workDir = store_.workDirectory(package.id);
    const auto& workspace = store_.workspace();

    Replacements values{
        {"SIPUUID", package.id},
        {"SIPName", package.name},
        {"SIPDirectory", withSlash(workDir)},
        {"transferDirectory", withSlash(workDir)},
        {"SIPObjectsDirectory", withSlash(workDir / "objects")},
        {"SIPLogsDirectory", withSlash(workDir / "logs")},
        {"SIPDirectoryBasename", store_.packageDirectory(package.id).filename().string()},
        {"URL", package.sourceLocation},
        {"completedDirectory", withSlash(workspace / "completed")},
        {"tmpDirectory", withSlash(workspace / "tmp")},
    };

    for (const auto& option : ProcessingConfig::options()) {
        if (auto value = package.config.value(option.name)) {
            values.emplace("config:" + option.name, *value);
        }
    }
    for (const auto& [name, value] : package.variables) {
        values.emplace("variable:" + name, value);
    }
    return values;
}

Replacements Engine::fileReplacements(const PackageRecord& package, const FileEntry& file) const {
    Replacements values = packageReplacements(package);
    const std::filesystem::path absolute = store_.workDirectory(package.id) / file.path;
    const std::string extension = absolute.extension().string();

    values["fileUUID"] = file.id;
    values["inputFile"] = absolute.string();
    values["relativeLocation"] = absolute.string();
    values["fileName"] = absolute.stem().string();
    values["fileExtension"] = extension.empty() ? extension : extension.substr(1);
    values["fileExtensionWithDot"] = extension;
    values["fileDirectory"] = absolute.parent_path().string();
    return values;
}

PackageStatus Engine::finish(const PackageId& id, PackageStatus status, const FailureDetail& failure) {
    if (!store_.finishPackage(id, status, failure)) {
        PackageStatus current = store_.packageStatus(id);
        LOG_WARN("Package " + id + " could not be finished as " + toString(status) + ", now " + toString(current));
        return current;
    }
    if (status == PackageStatus::Complete) {
        LOG_INFO("Package " + id + " COMPLETE");
    } else {
        LOG_WARN("Package " + id + " " + toString(status) + ": " + failure.message);
    }
    return status;
}

PackageStatus Engine::fail(const PackageId& id, const JobRecord* job, FailureKind kind, const std::string& message) {
    LOG_ERROR(std::string(toString(kind)) + " error in package " + id +
              (job ? " job " + job->id + " link " + job->linkId : std::string()) + ": " + message);

    if (job != nullptr) {
        JobRecord failed = *job;
        failed.status = JobStatus::Failed;
        failed.endTime = Clock::now();
        failed.error = {kind, message};
        if (!store_.finishJob(failed)) {
            LOG_ERROR("Cannot record failure of job " + job->id);
        }
    }
    return finish(id, PackageStatus::Failed, {kind, message});
}

}
