/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace archivist {

enum class CompressionAlgorithm : std::uint8_t {
    Unspecified = 0,
    Uncompressed = 1,
    Tar = 2,
    TarBzip2 = 3,
    TarGzip = 4,
    S7Copy = 5,
    S7Bzip2 = 6,
    S7Lzma = 7
};

enum class ThumbnailMode : std::uint8_t {
    Unspecified = 0,
    Generate = 1,
    GenerateNonDefault = 2,
    DoNotGenerate = 3
};

enum class OptionKind : std::uint8_t { Boolean, Integer, Enumeration };

// Describes one named option: what a decision link may branch on.
struct OptionSpec {
    std::string name;
    OptionKind kind;
    int minValue = 0;
    int maxValue = 0;
    std::vector<std::string> values; // legal values, canonical spelling
};

struct ConfigResult;

// Switches resolved once per package at submission. Never mutated while the
// package is processing.
struct ProcessingConfig {
    static constexpr int kVersion = 1;

    bool assignUuidsToDirectories = true;
    bool examineContents = false;
    bool generateTransferStructureReport = false;
    bool documentEmptyDirectories = true;
    bool extractPackages = true;
    bool deletePackagesAfterExtraction = false;
    bool identifyTransfer = true;
    bool identifySubmissionAndMetadata = true;
    bool identifyBeforeNormalization = true;
    bool normalize = true;
    bool transcribeFiles = false;
    bool performPolicyChecksOnOriginals = false;
    bool performPolicyChecksOnPreservationDerivatives = false;
    bool performPolicyChecksOnAccessDerivatives = false;
    int aipCompressionLevel = 1;
    CompressionAlgorithm aipCompressionAlgorithm = CompressionAlgorithm::S7Bzip2;
    ThumbnailMode thumbnailMode = ThumbnailMode::Generate;

    // Overlay a JSON object on the defaults. Unknown keys, wrong types and
    // out of range values are errors.
    [[nodiscard]] static ConfigResult fromJson(const nlohmann::json& doc);
    [[nodiscard]] nlohmann::json toJson() const;

    [[nodiscard]] bool validate(std::string& error) const;

    // Canonical string value of a named option ("true", "7", "s7_bzip2").
    [[nodiscard]] std::optional<std::string> value(const std::string& option) const;

    [[nodiscard]] static const std::vector<OptionSpec>& options();
    [[nodiscard]] static const OptionSpec* findOption(const std::string& name) noexcept;
};

struct ConfigResult {
    bool ok = false;
    ProcessingConfig config;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(CompressionAlgorithm algorithm) noexcept;
[[nodiscard]] const char* toString(ThumbnailMode mode) noexcept;

// Serialize a document for a record or a message. Bytes that are not valid
// UTF-8 become U+FFFD instead of throwing.
[[nodiscard]] std::string dumpJson(const nlohmann::json& doc, int indent = -1);

}
