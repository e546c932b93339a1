/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/config.hpp"
#include "archivist/logger.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>

namespace archivist {

namespace {

struct BoolOption {
    const char* name;
    bool ProcessingConfig::*member;
};

const std::array<BoolOption, 14> kBoolOptions = {{
    {"assign_uuids_to_directories", &ProcessingConfig::assignUuidsToDirectories},
    {"examine_contents", &ProcessingConfig::examineContents},
    {"generate_transfer_structure_report", &ProcessingConfig::generateTransferStructureReport},
    {"document_empty_directories", &ProcessingConfig::documentEmptyDirectories},
    {"extract_packages", &ProcessingConfig::extractPackages},
    {"delete_packages_after_extraction", &ProcessingConfig::deletePackagesAfterExtraction},
    {"identify_transfer", &ProcessingConfig::identifyTransfer},
    {"identify_submission_and_metadata", &ProcessingConfig::identifySubmissionAndMetadata},
    {"identify_before_normalization", &ProcessingConfig::identifyBeforeNormalization},
    {"normalize", &ProcessingConfig::normalize},
    {"transcribe_files", &ProcessingConfig::transcribeFiles},
    {"perform_policy_checks_on_originals", &ProcessingConfig::performPolicyChecksOnOriginals},
    {"perform_policy_checks_on_preservation_derivatives",
        &ProcessingConfig::performPolicyChecksOnPreservationDerivatives},
    {"perform_policy_checks_on_access_derivatives",
        &ProcessingConfig::performPolicyChecksOnAccessDerivatives},
}};

constexpr const char* kCompressionLevel = "aip_compression_level";
constexpr const char* kCompressionAlgorithm = "aip_compression_algorithm";
constexpr const char* kThumbnailMode = "thumbnail_mode";

const std::array<std::pair<CompressionAlgorithm, const char*>, 7> kAlgorithms = {{
    {CompressionAlgorithm::Uncompressed, "uncompressed"},
    {CompressionAlgorithm::Tar, "tar"},
    {CompressionAlgorithm::TarBzip2, "tar_bzip2"},
    {CompressionAlgorithm::TarGzip, "tar_gzip"},
    {CompressionAlgorithm::S7Copy, "s7_copy"},
    {CompressionAlgorithm::S7Bzip2, "s7_bzip2"},
    {CompressionAlgorithm::S7Lzma, "s7_lzma"},
}};

const std::array<std::pair<ThumbnailMode, const char*>, 3> kThumbnailModes = {{
    {ThumbnailMode::Generate, "generate"},
    {ThumbnailMode::GenerateNonDefault, "generate_non_default"},
    {ThumbnailMode::DoNotGenerate, "do_not_generate"},
}};

template <typename E, std::size_t N>
std::optional<E> enumFromString(const std::array<std::pair<E, const char*>, N>& table, const std::string& text) {
    for (const auto& entry : table) {
        if (text == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

}

const char* toString(CompressionAlgorithm algorithm) noexcept {
    for (const auto& entry : kAlgorithms) {
        if (entry.first == algorithm) return entry.second;
    }
    return "unspecified";
}

const char* toString(ThumbnailMode mode) noexcept {
    for (const auto& entry : kThumbnailModes) {
        if (entry.first == mode) return entry.second;
    }
    return "unspecified";
}

const std::vector<OptionSpec>& ProcessingConfig::options() {
    static const std::vector<OptionSpec> specs = [] {
        std::vector<OptionSpec> out;
        for (const auto& option : kBoolOptions) {
            out.push_back({option.name, OptionKind::Boolean, 0, 0, {"false", "true"}});
        }

        OptionSpec level{kCompressionLevel, OptionKind::Integer, 1, 9, {}};
        for (int i = level.minValue; i <= level.maxValue; ++i) {
            level.values.push_back(std::to_string(i));
        }
        out.push_back(level);

        OptionSpec algorithm{kCompressionAlgorithm, OptionKind::Enumeration, 0, 0, {}};
        for (const auto& entry : kAlgorithms) algorithm.values.emplace_back(entry.second);
        out.push_back(algorithm);

        OptionSpec thumbnails{kThumbnailMode, OptionKind::Enumeration, 0, 0, {}};
        for (const auto& entry : kThumbnailModes) thumbnails.values.emplace_back(entry.second);
        out.push_back(thumbnails);
        return out;
    }();
    return specs;
}

const OptionSpec* ProcessingConfig::findOption(const std::string& name) noexcept {
    const auto& specs = options();
    auto it = std::find_if(specs.begin(), specs.end(),
                           [&name](const OptionSpec& spec) { return spec.name == name; });
    return it == specs.end() ? nullptr : &*it;
}

ConfigResult ProcessingConfig::fromJson(const nlohmann::json& doc) {
    ConfigResult result;
    if (doc.is_null()) {
        result.ok = true;
        return result;
    }
    if (!doc.is_object()) {
        result.message = "Processing configuration must be a JSON object";
        return result;
    }

    ProcessingConfig config;
    for (const auto& item : doc.items()) {
        const std::string& key = item.key();
        const nlohmann::json& value = item.value();

        if (key == "version") {
            if (!value.is_number_integer() || value.get<std::int64_t>() != kVersion) {
                result.message = "Unsupported processing configuration version: " + dumpJson(value);
                return result;
            }
            continue;
        }

        auto boolOption = std::find_if(kBoolOptions.begin(), kBoolOptions.end(),
                                       [&key](const BoolOption& option) { return key == option.name; });
        if (boolOption != kBoolOptions.end()) {
            if (!value.is_boolean()) {
                result.message = "Option " + key + " must be a boolean";
                return result;
            }
            config.*(boolOption->member) = value.get<bool>();
        } else if (key == kCompressionLevel) {
            if (!value.is_number_integer()) {
                result.message = "Option " + key + " must be an integer";
                return result;
            }
            auto level = value.get<std::int64_t>();
            if (level < 1 || level > 9) {
                result.message = "aip_compression_level must be between 1 and 9, got " + dumpJson(value);
                return result;
            }
            config.aipCompressionLevel = static_cast<int>(level);
        } else if (key == kCompressionAlgorithm) {
            auto parsed = value.is_string() ? enumFromString(kAlgorithms, value.get<std::string>())
                                            : std::nullopt;
            if (!parsed) {
                result.message = "Unknown value for " + key + ": " + dumpJson(value);
                return result;
            }
            config.aipCompressionAlgorithm = *parsed;
        } else if (key == kThumbnailMode) {
            auto parsed = value.is_string() ? enumFromString(kThumbnailModes, value.get<std::string>())
                                            : std::nullopt;
            if (!parsed) {
                result.message = "Unknown value for " + key + ": " + dumpJson(value);
                return result;
            }
            config.thumbnailMode = *parsed;
        } else {
            result.message = "Unknown processing configuration option: " + key;
            return result;
        }
    }

    if (!config.validate(result.message)) {
        return result;
    }

    result.ok = true;
    result.config = config;
    return result;
}

nlohmann::json ProcessingConfig::toJson() const {
    nlohmann::json doc = nlohmann::json::object();
    doc["version"] = kVersion;
    for (const auto& option : kBoolOptions) {
        doc[option.name] = this->*(option.member);
    }
    doc[kCompressionLevel] = aipCompressionLevel;
    doc[kCompressionAlgorithm] = toString(aipCompressionAlgorithm);
    doc[kThumbnailMode] = toString(thumbnailMode);
    return doc;
}

bool ProcessingConfig::validate(std::string& error) const {
    if (aipCompressionLevel < 1 || aipCompressionLevel > 9) {
        error = "aip_compression_level must be between 1 and 9, got " + std::to_string(aipCompressionLevel);
        return false;
    }
    if (aipCompressionAlgorithm == CompressionAlgorithm::Unspecified) {
        error = "aip_compression_algorithm is unspecified";
        return false;
    }
    if (thumbnailMode == ThumbnailMode::Unspecified) {
        error = "thumbnail_mode is unspecified";
        return false;
    }
    return true;
}

std::optional<std::string> ProcessingConfig::value(const std::string& option) const {
    for (const auto& boolOption : kBoolOptions) {
        if (option == boolOption.name) {
            return std::string(this->*(boolOption.member) ? "true" : "false");
        }
    }
    if (option == kCompressionLevel) {
        return std::to_string(aipCompressionLevel);
    }
    if (option == kCompressionAlgorithm) {
        return std::string(toString(aipCompressionAlgorithm));
    }
    if (option == kThumbnailMode) {
        return std::string(toString(thumbnailMode));
    }
    return std::nullopt;
}

std::string dumpJson(const nlohmann::json& doc, int indent) {
    return doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
