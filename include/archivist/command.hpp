/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace archivist {

// Token name (without the surrounding '%') to replacement value.
using Replacements = std::map<std::string, std::string>;

// Shell-like word splitting: whitespace separates words, single quotes are
// literal, double quotes allow backslash escapes of '"' and '\'.
// Returns nullopt on an unterminated quote.
[[nodiscard]] std::optional<std::vector<std::string>> splitArguments(const std::string& text);

// Replace every %name% whose name is in `values`. Unknown tokens are kept.
[[nodiscard]] std::string expand(const std::string& text, const Replacements& values);

// Split first, then expand each word, so a value containing spaces stays one
// argument.
[[nodiscard]] std::optional<std::vector<std::string>> expandArguments(const std::string& text,
                                                                      const Replacements& values);

}
