/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "archivist/types.hpp"

namespace archivist {

class WorkflowError : public std::runtime_error {
public:
    explicit WorkflowError(const std::string& message) : std::runtime_error(message) {}
};

class UnknownLinkError : public WorkflowError {
public:
    explicit UnknownLinkError(const std::string& id)
        : WorkflowError("Unknown link or chain: " + id), id_(id) {}

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

// Where a routing entry leads: a link (chains are resolved to their first
// link at load time) or a terminal outcome.
struct Route {
    LinkId link;
    std::optional<Outcome> outcome;

    [[nodiscard]] bool isTerminal() const noexcept { return outcome.has_value(); }
};

struct CodeRange {
    int low;
    int high;
    Route route;
};

enum class Scope : std::uint8_t { Package, Files };

struct RunAction {
    Scope scope = Scope::Package;
    std::string command;
    std::string arguments;
    std::string filterSubdir = "objects";
    bool unanimous = true;
    std::string stdoutFile;
    std::string stderrFile;
};

struct SetVariableAction {
    std::string name;
    std::string value;
};

// Branches on a Processing Configuration option; never runs a tool.
struct DecisionAction {
    std::string option;
    std::map<std::string, Route> choices;
};

struct NoOpAction {};

using Action = std::variant<RunAction, SetVariableAction, DecisionAction, NoOpAction>;

struct Link {
    LinkId id;
    std::string description;
    std::string group;
    Action action;
    std::vector<CodeRange> exitCodes; // sorted, non-overlapping
    Route fallback;

    [[nodiscard]] const Route& route(int exitCode) const noexcept;
    [[nodiscard]] const Route& choose(const std::string& value) const noexcept;
    [[nodiscard]] const char* actionName() const noexcept;
};

struct Chain {
    ChainId id;
    std::string description;
    std::vector<LinkId> links;
};

class Workflow final {
public:
    static constexpr int kVersion = 1;

    // Both throw WorkflowError (UnknownLinkError for dangling references).
    [[nodiscard]] static std::shared_ptr<const Workflow> load(const std::filesystem::path& path);
    [[nodiscard]] static std::shared_ptr<const Workflow> parse(const nlohmann::json& doc);

    Workflow(const Workflow&) = delete;
    Workflow& operator=(const Workflow&) = delete;
    Workflow(Workflow&&) = delete;
    Workflow& operator=(Workflow&&) = delete;

    [[nodiscard]] const Link& resolve(const LinkId& id) const;
    [[nodiscard]] const Link* find(const LinkId& id) const noexcept;

    [[nodiscard]] const Chain& entryChain() const noexcept;
    [[nodiscard]] const LinkId& entryLink() const noexcept;
    [[nodiscard]] const Chain* chain(const ChainId& id) const noexcept;
    // First chain (in id order) that lists the link.
    [[nodiscard]] const Chain* chainOf(const LinkId& id) const noexcept;

    [[nodiscard]] const std::map<LinkId, Link>& links() const noexcept { return links_; }
    [[nodiscard]] const std::map<ChainId, Chain>& chains() const noexcept { return chains_; }

    // Links no route can reach from the entry link.
    [[nodiscard]] std::vector<LinkId> unreachableLinks() const;

private:
    Workflow() = default;

    std::map<LinkId, Link> links_;
    std::map<ChainId, Chain> chains_;
    std::map<LinkId, ChainId> chainOfLink_;
    ChainId entryChain_;
};

}
