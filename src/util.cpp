/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/util.hpp"
#include "archivist/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace archivist {

std::string generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::ostringstream ss;
    ss << std::setw(16) << std::setfill('0') << now << "_"
       << std::setw(7) << std::setfill('0') << getpid() << "_"
       << std::setw(8) << std::setfill('0') << unique_counter;
    return ss.str();
}

std::size_t envSize(const char* name, std::size_t defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid value for ") + name + ": " + val);
        return defv;
    }
}

std::string envString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::string formatTimestamp(TimePoint tp) {
    auto usec = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(usec / 1000000);
    long frac = static_cast<long>(usec % 1000000);
    if (frac < 0) {
        frac += 1000000;
        --secs;
    }

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "."
       << std::setw(6) << std::setfill('0') << frac << "Z";
    return ss.str();
}

std::optional<TimePoint> parseTimestamp(const std::string& text) noexcept {
    std::tm utc{};
    long frac = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%6ldZ%n",
                    &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                    &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &frac, &consumed) != 7 ||
        static_cast<std::size_t>(consumed) != text.size()) {
        return std::nullopt;
    }
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;

    std::time_t secs = timegm(&utc);
    if (secs == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(secs) + std::chrono::microseconds(frac)));
}

std::optional<std::string> readFile(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        if (file.bad()) {
            return std::nullopt;
        }
        return content;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

namespace {
bool writeTemp(const std::filesystem::path& tempPath, const std::string& content) noexcept {
    try {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) return false;
        file << content;
        file.flush();
        file.close();
        return file.good();
    } catch (const std::exception&) {
        return false;
    }
}

std::filesystem::path tempPathFor(const std::filesystem::path& path) {
    return path.parent_path() / (path.filename().string() + ".tmp." + generateId());
}
}

bool writeFileAtomic(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        auto tempPath = tempPathFor(path);
        if (!writeTemp(tempPath, content)) {
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
            LOG_ERROR("Failed to write " + tempPath.string());
            return false;
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            LOG_ERROR("Failed to publish " + path.string() + ": " + ec.message());
            std::filesystem::remove(tempPath, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write " + path.string() + ": " + e.what());
        return false;
    }
}

ExclusiveWrite writeFileExclusive(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        auto tempPath = tempPathFor(path);
        if (!writeTemp(tempPath, content)) {
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
            LOG_ERROR("Failed to write " + tempPath.string());
            return ExclusiveWrite::Failed;
        }

        // link(2) refuses to replace an existing name, rename(2) would not
        int rc = ::link(tempPath.c_str(), path.c_str());
        int err = errno;
        std::error_code ec;
        std::filesystem::remove(tempPath, ec);

        if (rc == 0) {
            return ExclusiveWrite::Created;
        }
        if (err == EEXIST) {
            return ExclusiveWrite::Exists;
        }
        LOG_ERROR("Failed to publish " + path.string() + ": " + std::strerror(err));
        return ExclusiveWrite::Failed;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write " + path.string() + ": " + e.what());
        return ExclusiveWrite::Failed;
    }
}

}
