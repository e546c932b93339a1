/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/command.hpp"
#include <cctype>

namespace archivist {

std::optional<std::vector<std::string>> splitArguments(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    char quote = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (quote == '\'') {
            if (c == '\'') {
                quote = 0;
            } else {
                current += c;
            }
            continue;
        }

        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
                current += text[++i];
            } else {
                current += c;
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
            continue;
        }

        inWord = true;
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\' && i + 1 < text.size()) {
            current += text[++i];
        } else {
            current += c;
        }
    }

    if (quote != 0) {
        return std::nullopt;
    }
    if (inWord) {
        words.push_back(current);
    }
    return words;
}

std::string expand(const std::string& text, const Replacements& values) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t open = text.find('%', pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        std::size_t close = text.find('%', open + 1);
        if (close == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }

        out.append(text, pos, open - pos);
        auto it = values.find(text.substr(open + 1, close - open - 1));
        if (it != values.end()) {
            out += it->second;
            pos = close + 1;
        } else {
            // The closing '%' may open the next token: "100%%fileUUID%"
            out += '%';
            pos = open + 1;
        }
    }
    return out;
}

std::optional<std::vector<std::string>> expandArguments(const std::string& text, const Replacements& values) {
    auto words = splitArguments(text);
    if (!words) {
        return std::nullopt;
    }
    for (auto& word : *words) {
        word = expand(word, values);
    }
    return words;
}

}
