/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace archivist {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Fixed-width, lexicographically time-ordered id: <usec>_<pid>_<counter>.
[[nodiscard]] std::string generateId();

[[nodiscard]] std::size_t envSize(const char* name, std::size_t defv) noexcept;
[[nodiscard]] std::string envString(const char* name, const std::string& defv = "");

[[nodiscard]] std::string toLowerCopy(std::string value);
[[nodiscard]] std::string trim(std::string value);

// UTC, microsecond precision: 2025-01-31T08:15:02.123456Z
[[nodiscard]] std::string formatTimestamp(TimePoint tp);
[[nodiscard]] std::optional<TimePoint> parseTimestamp(const std::string& text) noexcept;

[[nodiscard]] std::optional<std::string> readFile(const std::filesystem::path& path) noexcept;

// Write to <path>.tmp.<id> then rename over <path>.
[[nodiscard]] bool writeFileAtomic(const std::filesystem::path& path, const std::string& content) noexcept;

enum class ExclusiveWrite : std::uint8_t { Created, Exists, Failed };

// Publish <path> only if it does not exist yet (hard link of a temp file).
[[nodiscard]] ExclusiveWrite writeFileExclusive(const std::filesystem::path& path, const std::string& content) noexcept;

}
