/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/store.hpp"
#include "archivist/logger.hpp"
#include <algorithm>
#include <climits>
#include <cstdint>

namespace archivist {

namespace {

using json = nlohmann::json;

constexpr const char* kPackageFile = "package.json";
constexpr const char* kFilesFile = "files.json";
constexpr const char* kJobFile = "job.json";
constexpr const char* kPackageTaskKey = "package";

json timeOrNull(const std::optional<TimePoint>& tp) {
    return tp ? json(formatTimestamp(*tp)) : json(nullptr);
}

std::optional<TimePoint> readTime(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) {
        return std::nullopt;
    }
    return parseTimestamp(it->get<std::string>());
}

json failureToJson(const FailureDetail& failure) {
    if (failure.kind == FailureKind::None) {
        return nullptr;
    }
    return json{{"kind", toString(failure.kind)}, {"message", failure.message}};
}

FailureDetail failureFromJson(const json& doc, const char* key) {
    FailureDetail failure;
    auto it = doc.find(key);
    if (it != doc.end() && it->is_object()) {
        failure.kind = parseFailureKind(it->value("kind", "")).value_or(FailureKind::None);
        failure.message = it->value("message", "");
    }
    return failure;
}

std::optional<int> readCode(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    auto code = it->get<std::int64_t>();
    if (code < INT_MIN || code > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(code);
}

std::optional<json> loadJson(const std::filesystem::path& path) noexcept {
    auto content = readFile(path);
    if (!content) {
        return std::nullopt;
    }
    try {
        return json::parse(*content);
    } catch (const json::parse_error& e) {
        LOG_ERROR("Corrupt record " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool saveJson(const std::filesystem::path& path, const json& doc) noexcept {
    try {
        return writeFileAtomic(path, dumpJson(doc, 2));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to serialize " + path.string() + ": " + e.what());
        return false;
    }
}

// File registry keys are on-disk names, which need not be UTF-8. Escape
// '%', control and non-ASCII bytes as %XX so the registry stays valid JSON.
std::string encodeRegistryPath(const std::string& path) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        auto byte = static_cast<unsigned char>(c);
        if (byte == '%' || byte < 0x20 || byte >= 0x7F) {
            out += '%';
            out += kHex[byte >> 4];
            out += kHex[byte & 0x0F];
        } else {
            out += c;
        }
    }
    return out;
}

int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::optional<std::string> decodeRegistryPath(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (key[i] != '%') {
            out += key[i];
            continue;
        }
        if (i + 2 >= key.size()) {
            return std::nullopt;
        }
        int high = hexValue(key[i + 1]);
        int low = hexValue(key[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out += static_cast<char>((high << 4) | low);
        i += 2;
    }
    return out;
}

// path -> file id, decoded from files.json.
std::optional<std::map<std::string, FileId>> loadRegistry(const std::filesystem::path& path) {
    auto doc = loadJson(path);
    if (!doc || !doc->is_object()) {
        return std::nullopt;
    }
    std::map<std::string, FileId> registry;
    for (const auto& item : doc->items()) {
        auto decoded = decodeRegistryPath(item.key());
        if (!decoded || !item.value().is_string()) {
            LOG_ERROR("Malformed file registry entry in " + path.string() + ": " + item.key());
            return std::nullopt;
        }
        registry.emplace(std::move(*decoded), item.value().get<FileId>());
    }
    return registry;
}

}

json PackageRecord::toJson() const {
    return json{
        {"id", id},
        {"name", name},
        {"source", sourceLocation},
        {"status", toString(status)},
        {"failure", failureToJson(failure)},
        {"config", config.toJson()},
        {"variables", variables},
        {"created_at", formatTimestamp(createdAt)},
        {"completed_at", timeOrNull(completedAt)},
        {"purged", purged},
    };
}

std::optional<PackageRecord> PackageRecord::fromJson(const json& doc) noexcept {
    try {
        PackageRecord record;
        record.id = doc.at("id").get<std::string>();
        record.name = doc.value("name", "");
        record.sourceLocation = doc.value("source", "");

        auto status = parsePackageStatus(doc.at("status").get<std::string>());
        if (!status) {
            return std::nullopt;
        }
        record.status = *status;
        record.failure = failureFromJson(doc, "failure");

        auto config = ProcessingConfig::fromJson(doc.value("config", json::object()));
        if (!config) {
            LOG_ERROR("Package " + record.id + " has an invalid configuration: " + config.message);
            return std::nullopt;
        }
        record.config = config.config;

        record.variables = doc.value("variables", std::map<std::string, std::string>{});
        record.createdAt = readTime(doc, "created_at").value_or(TimePoint{});
        record.completedAt = readTime(doc, "completed_at");
        record.purged = doc.value("purged", false);
        return record;
    } catch (const json::exception& e) {
        LOG_ERROR(std::string("Malformed package record: ") + e.what());
        return std::nullopt;
    }
}

std::optional<PackageRecord> PackageRecord::load(const std::filesystem::path& path) noexcept {
    auto doc = loadJson(path);
    if (!doc) {
        return std::nullopt;
    }
    return fromJson(*doc);
}

json JobRecord::toJson() const {
    return json{
        {"id", id},
        {"package_id", packageId},
        {"link_id", linkId},
        {"name", name},
        {"group", group},
        {"chain_id", chainId},
        {"origin_link", originLink},
        {"sequence", sequence},
        {"status", toString(status)},
        {"start_time", formatTimestamp(startTime)},
        {"end_time", timeOrNull(endTime)},
        {"exit_code", exitCode ? json(*exitCode) : json(nullptr)},
        {"next_link", nextLink},
        {"outcome", outcome ? json(toString(*outcome)) : json(nullptr)},
        {"error", failureToJson(error)},
    };
}

std::optional<JobRecord> JobRecord::fromJson(const json& doc) noexcept {
    try {
        JobRecord job;
        job.id = doc.at("id").get<std::string>();
        job.packageId = doc.at("package_id").get<std::string>();
        job.linkId = doc.at("link_id").get<std::string>();
        job.name = doc.value("name", "");
        job.group = doc.value("group", "");
        job.chainId = doc.value("chain_id", "");
        job.originLink = doc.value("origin_link", "");
        job.sequence = doc.value("sequence", std::uint64_t{0});

        auto status = parseJobStatus(doc.at("status").get<std::string>());
        if (!status) {
            return std::nullopt;
        }
        job.status = *status;
        job.startTime = readTime(doc, "start_time").value_or(TimePoint{});
        job.endTime = readTime(doc, "end_time");
        job.exitCode = readCode(doc, "exit_code");
        job.nextLink = doc.value("next_link", "");

        auto outcome = doc.find("outcome");
        if (outcome != doc.end() && outcome->is_string()) {
            job.outcome = parseOutcome(outcome->get<std::string>());
        }
        job.error = failureFromJson(doc, "error");
        return job;
    } catch (const json::exception& e) {
        LOG_ERROR(std::string("Malformed job record: ") + e.what());
        return std::nullopt;
    }
}

json TaskRecord::toJson() const {
    return json{
        {"id", id},
        {"job_id", jobId},
        {"file_id", fileId},
        {"filename", filename},
        {"sequence", sequence},
        {"execution", execution},
        {"arguments", arguments},
        {"exit_code", exitCode ? json(*exitCode) : json(nullptr)},
        {"stdout", stdoutText},
        {"stderr", stderrText},
        {"start_time", formatTimestamp(startTime)},
        {"end_time", timeOrNull(endTime)},
        {"truncated", truncated},
    };
}

std::optional<TaskRecord> TaskRecord::fromJson(const json& doc) noexcept {
    try {
        TaskRecord task;
        task.id = doc.at("id").get<std::string>();
        task.jobId = doc.at("job_id").get<std::string>();
        task.fileId = doc.value("file_id", "");
        task.filename = doc.value("filename", "");
        task.sequence = doc.value("sequence", std::uint64_t{0});
        task.execution = doc.value("execution", "");
        task.arguments = doc.value("arguments", std::vector<std::string>{});
        task.exitCode = readCode(doc, "exit_code");
        task.stdoutText = doc.value("stdout", "");
        task.stderrText = doc.value("stderr", "");
        task.startTime = readTime(doc, "start_time").value_or(TimePoint{});
        task.endTime = readTime(doc, "end_time");
        task.truncated = doc.value("truncated", false);
        return task;
    } catch (const json::exception& e) {
        LOG_ERROR(std::string("Malformed task record: ") + e.what());
        return std::nullopt;
    }
}

Store::Store(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace), packagesPath_(workspace / "packages") {
    LOG_DEBUG("Store created for workspace: " + workspace_.string());
}

std::filesystem::path Store::packageDirectory(const PackageId& id) const {
    return packagesPath_ / id;
}

std::filesystem::path Store::workDirectory(const PackageId& id) const {
    return packageDirectory(id) / "work";
}

std::filesystem::path Store::jobDirectory(const PackageId& packageId, const JobId& jobId) const {
    return packageDirectory(packageId) / "jobs" / jobId;
}

std::filesystem::path Store::taskPath(const JobRecord& job, const FileId& fileId) const {
    const std::string key = fileId.empty() ? kPackageTaskKey : fileId;
    return jobDirectory(job.packageId, job.id) / "tasks" / (key + ".json");
}

bool Store::createPackage(const PackageRecord& record) noexcept {
    try {
        auto dir = packageDirectory(record.id);
        if (std::filesystem::exists(dir / kPackageFile)) {
            LOG_WARN("Package already exists: " + record.id);
            return false;
        }
        std::filesystem::create_directories(dir / "jobs");
        std::filesystem::create_directories(dir / "work" / "objects");
        std::filesystem::create_directories(dir / "work" / "logs");
        std::filesystem::create_directories(dir / "work" / "metadata");

        std::lock_guard<std::mutex> lock(packageMutex_);
        return writePackage(record);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create package " + record.id + ": " + e.what());
        return false;
    }
}

bool Store::writePackage(const PackageRecord& record) noexcept {
    return saveJson(packageDirectory(record.id) / kPackageFile, record.toJson());
}

std::optional<PackageRecord> Store::package(const PackageId& id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(packageMutex_);
        return PackageRecord::load(packageDirectory(id) / kPackageFile);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read package " + id + ": " + e.what());
        return std::nullopt;
    }
}

PackageStatus Store::packageStatus(const PackageId& id) const noexcept {
    auto record = package(id);
    return record ? record->status : PackageStatus::Unspecified;
}

std::vector<PackageId> Store::packageIds() const noexcept {
    std::vector<PackageId> ids;
    try {
        if (!std::filesystem::exists(packagesPath_)) {
            return ids;
        }
        for (const auto& entry : std::filesystem::directory_iterator(packagesPath_)) {
            if (entry.is_directory() && std::filesystem::exists(entry.path() / kPackageFile)) {
                ids.push_back(entry.path().filename().string());
            }
        }
        std::sort(ids.begin(), ids.end());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list packages: " + std::string(e.what()));
    }
    return ids;
}

bool Store::finishPackage(const PackageId& id, PackageStatus status, const FailureDetail& failure) noexcept {
    if (!isTerminal(status)) {
        LOG_ERROR("Refusing non-terminal finish status for package " + id + ": " + toString(status));
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(packageMutex_);
        auto record = PackageRecord::load(packageDirectory(id) / kPackageFile);
        if (!record) {
            LOG_ERROR("Cannot finish unknown package: " + id);
            return false;
        }
        if (record->status != PackageStatus::Processing) {
            LOG_WARN("Package " + id + " is already " + toString(record->status));
            return false;
        }
        record->status = status;
        record->failure = failure;
        record->completedAt = Clock::now();
        if (!writePackage(*record)) {
            return false;
        }
        forgetPackage(id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finish package " + id + ": " + e.what());
        return false;
    }
}

bool Store::setVariable(const PackageId& id, const std::string& name, const std::string& value) noexcept {
    try {
        std::lock_guard<std::mutex> lock(packageMutex_);
        auto record = PackageRecord::load(packageDirectory(id) / kPackageFile);
        if (!record || isTerminal(record->status)) {
            return false;
        }
        record->variables[name] = value;
        return writePackage(*record);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to set variable " + name + " on package " + id + ": " + e.what());
        return false;
    }
}

std::optional<JobRecord> Store::createJob(JobRecord job) noexcept {
    try {
        std::lock_guard<std::mutex> lock(packageMutex_);
        auto record = PackageRecord::load(packageDirectory(job.packageId) / kPackageFile);
        if (!record) {
            LOG_ERROR("Cannot create job for unknown package: " + job.packageId);
            return std::nullopt;
        }
        if (isTerminal(record->status)) {
            LOG_WARN("Refusing new job for " + std::string(toString(record->status)) + " package " + job.packageId);
            return std::nullopt;
        }

        auto jobsPath = packageDirectory(job.packageId) / "jobs";
        {
            std::lock_guard<std::mutex> indexLock(indexMutex_);
            auto it = jobSequence_.find(job.packageId);
            if (it == jobSequence_.end()) {
                std::uint64_t existing = 0;
                if (std::filesystem::exists(jobsPath)) {
                    for (const auto& entry : std::filesystem::directory_iterator(jobsPath)) {
                        if (entry.is_directory()) ++existing;
                    }
                }
                it = jobSequence_.emplace(job.packageId, existing).first;
            }
            job.sequence = it->second++;
        }

        job.id = generateId();
        job.status = JobStatus::Processing;
        job.startTime = Clock::now();
        job.endTime.reset();

        auto dir = jobDirectory(job.packageId, job.id);
        std::filesystem::create_directories(dir / "tasks");
        if (!saveJson(dir / kJobFile, job.toJson())) {
            std::error_code ec;
            std::filesystem::remove_all(dir, ec);
            return std::nullopt;
        }

        rememberJob(job.id, job.packageId);
        LOG_DEBUG("Job " + job.id + " created for link " + job.linkId + " (package " + job.packageId + ")");
        return job;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job for package " + job.packageId + ": " + e.what());
        return std::nullopt;
    }
}

bool Store::finishJob(const JobRecord& job) noexcept {
    if (job.status != JobStatus::Complete && job.status != JobStatus::Failed) {
        LOG_ERROR("Refusing non-terminal finish status for job " + job.id);
        return false;
    }
    try {
        auto path = jobDirectory(job.packageId, job.id) / kJobFile;
        auto doc = loadJson(path);
        auto stored = doc ? JobRecord::fromJson(*doc) : std::nullopt;
        if (!stored) {
            LOG_ERROR("Cannot finish unknown job: " + job.id);
            return false;
        }
        if (stored->status != JobStatus::Processing) {
            LOG_WARN("Job " + job.id + " is already " + toString(stored->status));
            return false;
        }
        if (!saveJson(path, job.toJson())) {
            return false;
        }
        std::lock_guard<std::mutex> lock(indexMutex_);
        taskSequence_.erase(job.id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finish job " + job.id + ": " + e.what());
        return false;
    }
}

std::vector<JobRecord> Store::jobs(const PackageId& packageId) const noexcept {
    std::vector<JobRecord> result;
    try {
        auto jobsPath = packageDirectory(packageId) / "jobs";
        if (!std::filesystem::exists(jobsPath)) {
            return result;
        }
        for (const auto& entry : std::filesystem::directory_iterator(jobsPath)) {
            if (!entry.is_directory()) continue;
            auto doc = loadJson(entry.path() / kJobFile);
            if (!doc) continue;
            if (auto job = JobRecord::fromJson(*doc)) {
                result.push_back(std::move(*job));
            }
        }
        std::sort(result.begin(), result.end(), [](const JobRecord& a, const JobRecord& b) {
            return a.sequence != b.sequence ? a.sequence < b.sequence : a.id < b.id;
        });

        for (const auto& job : result) {
            rememberJob(job.id, packageId);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list jobs of package " + packageId + ": " + e.what());
    }
    return result;
}

std::optional<PackageId> Store::packageOfJob(const JobId& jobId) const noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = jobIndex_.find(jobId);
            if (it != jobIndex_.end()) {
                return it->second;
            }
        }
        if (jobId.empty() || jobId.find('/') != std::string::npos || !std::filesystem::exists(packagesPath_)) {
            return std::nullopt;
        }
        for (const auto& entry : std::filesystem::directory_iterator(packagesPath_)) {
            if (entry.is_directory() && std::filesystem::exists(entry.path() / "jobs" / jobId / kJobFile)) {
                PackageId packageId = entry.path().filename().string();
                rememberJob(jobId, packageId);
                return packageId;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to locate job " + jobId + ": " + e.what());
    }
    return std::nullopt;
}

void Store::rememberJob(const JobId& jobId, const PackageId& packageId) const {
    std::lock_guard<std::mutex> lock(indexMutex_);
    if (jobIndex_.size() >= kJobIndexLimit && jobIndex_.find(jobId) == jobIndex_.end()) {
        jobIndex_.clear();
    }
    jobIndex_[jobId] = packageId;
}

void Store::forgetPackage(const PackageId& id) {
    std::lock_guard<std::mutex> lock(indexMutex_);
    jobSequence_.erase(id);
    for (auto it = jobIndex_.begin(); it != jobIndex_.end();) {
        if (it->second == id) {
            taskSequence_.erase(it->first);
            it = jobIndex_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<JobRecord> Store::job(const JobId& id) const noexcept {
    auto packageId = packageOfJob(id);
    if (!packageId) {
        return std::nullopt;
    }
    auto doc = loadJson(jobDirectory(*packageId, id) / kJobFile);
    if (!doc) {
        return std::nullopt;
    }
    return JobRecord::fromJson(*doc);
}

std::uint64_t Store::nextTaskSequence(const JobRecord& job) {
    std::lock_guard<std::mutex> lock(indexMutex_);
    auto it = taskSequence_.find(job.id);
    if (it == taskSequence_.end()) {
        std::uint64_t existing = 0;
        auto tasksPath = jobDirectory(job.packageId, job.id) / "tasks";
        if (std::filesystem::exists(tasksPath)) {
            for (const auto& entry : std::filesystem::directory_iterator(tasksPath)) {
                if (entry.path().extension() == ".json") ++existing;
            }
        }
        it = taskSequence_.emplace(job.id, existing).first;
    }
    return it->second++;
}

ClaimResult Store::createTask(const JobRecord& job, TaskRecord& task) noexcept {
    try {
        task.jobId = job.id;
        task.id = generateId();
        task.sequence = nextTaskSequence(job);

        switch (writeFileExclusive(taskPath(job, task.fileId), dumpJson(task.toJson(), 2))) {
            case ExclusiveWrite::Created:
                return ClaimResult::Created;
            case ExclusiveWrite::Exists:
                LOG_DEBUG("Task already claimed for job " + job.id + " file " +
                          (task.fileId.empty() ? std::string(kPackageTaskKey) : task.fileId));
                return ClaimResult::Duplicate;
            default:
                return ClaimResult::IoError;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create task for job " + job.id + ": " + e.what());
        return ClaimResult::IoError;
    }
}

bool Store::completeTask(const JobRecord& job, const TaskRecord& task) noexcept {
    if (!task.completed()) {
        LOG_ERROR("Refusing to complete task " + task.id + " without an exit code");
        return false;
    }
    try {
        auto path = taskPath(job, task.fileId);
        auto doc = loadJson(path);
        auto stored = doc ? TaskRecord::fromJson(*doc) : std::nullopt;
        if (!stored || stored->id != task.id) {
            LOG_ERROR("Task " + task.id + " was not claimed by job " + job.id);
            return false;
        }
        if (stored->completed()) {
            LOG_WARN("Task " + task.id + " is already complete");
            return false;
        }
        return saveJson(path, task.toJson());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to complete task " + task.id + ": " + e.what());
        return false;
    }
}

std::vector<TaskRecord> Store::tasks(const JobRecord& job) const noexcept {
    std::vector<TaskRecord> result;
    try {
        auto tasksPath = jobDirectory(job.packageId, job.id) / "tasks";
        if (!std::filesystem::exists(tasksPath)) {
            return result;
        }
        for (const auto& entry : std::filesystem::directory_iterator(tasksPath)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
            auto doc = loadJson(entry.path());
            if (!doc) continue;
            if (auto task = TaskRecord::fromJson(*doc)) {
                result.push_back(std::move(*task));
            }
        }
        std::sort(result.begin(), result.end(), [](const TaskRecord& a, const TaskRecord& b) {
            return a.sequence != b.sequence ? a.sequence < b.sequence : a.id < b.id;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list tasks of job " + job.id + ": " + e.what());
    }
    return result;
}

std::vector<TaskRecord> Store::tasks(const JobId& jobId) const noexcept {
    auto record = job(jobId);
    if (!record) {
        return {};
    }
    return tasks(*record);
}

std::optional<std::vector<FileEntry>> Store::registerFiles(const PackageId& id, std::vector<std::string> paths) noexcept {
    try {
        std::lock_guard<std::mutex> lock(packageMutex_);
        auto registryPath = packageDirectory(id) / kFilesFile;

        std::map<std::string, FileId> registry;
        if (std::filesystem::exists(registryPath)) {
            auto loaded = loadRegistry(registryPath);
            if (!loaded) {
                LOG_ERROR("Unreadable file registry for package " + id);
                return std::nullopt;
            }
            registry = std::move(*loaded);
        }

        std::sort(paths.begin(), paths.end());
        paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

        bool changed = false;
        std::vector<FileEntry> entries;
        entries.reserve(paths.size());
        for (const auto& path : paths) {
            auto it = registry.find(path);
            if (it == registry.end()) {
                it = registry.emplace(path, generateId()).first;
                changed = true;
            }
            entries.push_back({it->second, path});
        }

        if (changed) {
            json doc = json::object();
            for (const auto& item : registry) {
                doc[encodeRegistryPath(item.first)] = item.second;
            }
            if (!saveJson(registryPath, doc)) {
                return std::nullopt;
            }
        }
        return entries;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to register files for package " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<FileEntry> Store::files(const PackageId& id) const noexcept {
    std::vector<FileEntry> entries;
    try {
        std::lock_guard<std::mutex> lock(packageMutex_);
        auto registry = loadRegistry(packageDirectory(id) / kFilesFile);
        if (!registry) {
            return entries;
        }
        for (const auto& item : *registry) {
            entries.push_back({item.second, item.first});
        }
        std::sort(entries.begin(), entries.end(),
                  [](const FileEntry& a, const FileEntry& b) { return a.id < b.id; });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read file registry of package " + id + ": " + e.what());
    }
    return entries;
}

bool Store::purgeWorkDirectory(const PackageId& id) noexcept {
    try {
        std::lock_guard<std::mutex> lock(packageMutex_);
        auto record = PackageRecord::load(packageDirectory(id) / kPackageFile);
        if (!record || !isTerminal(record->status) || record->purged) {
            return false;
        }

        std::error_code ec;
        std::filesystem::remove_all(workDirectory(id), ec);
        if (ec) {
            LOG_ERROR("Failed to purge working directory of " + id + ": " + ec.message());
            return false;
        }
        record->purged = true;
        if (!writePackage(*record)) {
            return false;
        }
        LOG_INFO("Purged working directory of package " + id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to purge package " + id + ": " + e.what());
        return false;
    }
}

}
