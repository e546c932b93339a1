/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/workflow.hpp"
#include "archivist/command.hpp"
#include "archivist/config.hpp"
#include "archivist/logger.hpp"
#include "archivist/util.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <set>

namespace archivist {

namespace {

using json = nlohmann::json;

std::string stringField(const json& obj, const char* key, const std::string& where, bool required) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        if (required) {
            throw WorkflowError(where + ": missing \"" + key + "\"");
        }
        return "";
    }
    if (!it->is_string()) {
        throw WorkflowError(where + ": \"" + key + "\" must be a string");
    }
    return it->get<std::string>();
}

bool boolField(const json& obj, const char* key, const std::string& where, bool defv) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return defv;
    }
    if (!it->is_boolean()) {
        throw WorkflowError(where + ": \"" + key + "\" must be a boolean");
    }
    return it->get<bool>();
}

std::optional<int> parseCode(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

// "N" or "A..B", inclusive.
std::optional<std::pair<int, int>> parseCodeKey(const std::string& key) {
    auto dots = key.find("..");
    if (dots == std::string::npos) {
        auto code = parseCode(key);
        if (!code) return std::nullopt;
        return std::make_pair(*code, *code);
    }
    auto low = parseCode(key.substr(0, dots));
    auto high = parseCode(key.substr(dots + 2));
    if (!low || !high || *low > *high) {
        return std::nullopt;
    }
    return std::make_pair(*low, *high);
}

class Parser {
public:
    Parser(const json& doc, std::map<ChainId, Chain>& chains, std::map<LinkId, Link>& links)
        : doc_(doc), chains_(chains), links_(links) {}

    void parseChains() {
        auto it = doc_.find("chains");
        if (it == doc_.end() || !it->is_object() || it->empty()) {
            throw WorkflowError("Workflow must define a non-empty \"chains\" object");
        }
        for (const auto& item : it->items()) {
            std::string where = "chain " + item.key();
            if (!item.value().is_object()) {
                throw WorkflowError(where + ": must be an object");
            }
            Chain chain;
            chain.id = item.key();
            chain.description = stringField(item.value(), "description", where, false);

            auto linksIt = item.value().find("links");
            if (linksIt == item.value().end() || !linksIt->is_array() || linksIt->empty()) {
                throw WorkflowError(where + ": \"links\" must be a non-empty array");
            }
            for (const auto& link : *linksIt) {
                if (!link.is_string()) {
                    throw WorkflowError(where + ": link ids must be strings");
                }
                chain.links.push_back(link.get<std::string>());
            }
            chains_.emplace(chain.id, std::move(chain));
        }
    }

    void parseLinks() {
        auto it = doc_.find("links");
        if (it == doc_.end() || !it->is_object() || it->empty()) {
            throw WorkflowError("Workflow must define a non-empty \"links\" object");
        }
        // Routes may point forward, so collect every id before parsing any.
        for (const auto& item : it->items()) {
            linkIds_.insert(item.key());
        }
        for (const auto& item : it->items()) {
            if (chains_.count(item.key()) != 0) {
                throw WorkflowError("Id used for both a chain and a link: " + item.key());
            }
            links_.emplace(item.key(), parseLink(item.key(), item.value()));
        }
    }

    void checkChains() const {
        for (const auto& [id, chain] : chains_) {
            for (const auto& linkId : chain.links) {
                if (linkIds_.count(linkId) == 0) {
                    throw UnknownLinkError(linkId);
                }
            }
        }
    }

private:
    Link parseLink(const LinkId& id, const json& obj) {
        std::string where = "link " + id;
        if (!obj.is_object()) {
            throw WorkflowError(where + ": must be an object");
        }

        Link link;
        link.id = id;
        link.description = stringField(obj, "description", where, false);
        link.group = stringField(obj, "group", where, false);

        auto actionIt = obj.find("action");
        if (actionIt == obj.end() || !actionIt->is_object()) {
            throw WorkflowError(where + ": missing \"action\" object");
        }
        link.action = parseAction(*actionIt, where);

        auto fallbackIt = obj.find("fallback");
        if (fallbackIt == obj.end()) {
            throw WorkflowError(where + ": missing \"fallback\" route");
        }
        link.fallback = parseRoute(*fallbackIt, where + " fallback");

        bool isDecision = std::holds_alternative<DecisionAction>(link.action);
        auto codesIt = obj.find("exit_codes");
        auto choicesIt = obj.find("choices");

        if (isDecision) {
            if (codesIt != obj.end()) {
                throw WorkflowError(where + ": decision links route on \"choices\", not \"exit_codes\"");
            }
            parseChoices(std::get<DecisionAction>(link.action), choicesIt == obj.end() ? json::object() : *choicesIt,
                         where);
        } else {
            if (choicesIt != obj.end()) {
                throw WorkflowError(where + ": only decision links may have \"choices\"");
            }
            if (codesIt != obj.end()) {
                link.exitCodes = parseExitCodes(*codesIt, where);
            }
        }
        return link;
    }

    Action parseAction(const json& obj, const std::string& where) {
        std::string type = stringField(obj, "type", where + " action", true);

        if (type == "run") {
            RunAction run;
            run.command = stringField(obj, "command", where + " action", true);
            if (run.command.empty()) {
                throw WorkflowError(where + ": run action has an empty command");
            }
            run.arguments = stringField(obj, "arguments", where + " action", false);
            if (!splitArguments(run.arguments)) {
                throw WorkflowError(where + ": unterminated quote in arguments");
            }

            std::string scope = stringField(obj, "scope", where + " action", false);
            if (scope.empty() || scope == "package") {
                run.scope = Scope::Package;
            } else if (scope == "files") {
                run.scope = Scope::Files;
            } else {
                throw WorkflowError(where + ": unknown scope \"" + scope + "\"");
            }

            if (obj.contains("filter_subdir")) {
                run.filterSubdir = stringField(obj, "filter_subdir", where + " action", true);
            }
            std::filesystem::path subdir(run.filterSubdir);
            if (subdir.is_absolute() ||
                std::find(subdir.begin(), subdir.end(), std::filesystem::path("..")) != subdir.end()) {
                throw WorkflowError(where + ": filter_subdir must stay inside the working directory");
            }

            run.unanimous = boolField(obj, "unanimous", where + " action", true);
            run.stdoutFile = stringField(obj, "stdout_file", where + " action", false);
            run.stderrFile = stringField(obj, "stderr_file", where + " action", false);
            return run;
        }

        if (type == "set_variable") {
            SetVariableAction set;
            set.name = stringField(obj, "name", where + " action", true);
            set.value = stringField(obj, "value", where + " action", false);
            if (set.name.empty()) {
                throw WorkflowError(where + ": set_variable needs a name");
            }
            return set;
        }

        if (type == "decision") {
            DecisionAction decision;
            decision.option = stringField(obj, "option", where + " action", true);
            if (ProcessingConfig::findOption(decision.option) == nullptr) {
                throw WorkflowError(where + ": decision on unknown option \"" + decision.option + "\"");
            }
            return decision;
        }

        if (type == "noop") {
            return NoOpAction{};
        }

        throw WorkflowError(where + ": unknown action type \"" + type + "\"");
    }

    void parseChoices(DecisionAction& decision, const json& obj, const std::string& where) {
        if (!obj.is_object()) {
            throw WorkflowError(where + ": \"choices\" must be an object");
        }
        const OptionSpec* spec = ProcessingConfig::findOption(decision.option);
        for (const auto& item : obj.items()) {
            if (std::find(spec->values.begin(), spec->values.end(), item.key()) == spec->values.end()) {
                throw WorkflowError(where + ": \"" + item.key() + "\" is not a value of " + decision.option);
            }
            decision.choices.emplace(item.key(), parseRoute(item.value(), where + " choice " + item.key()));
        }
    }

    std::vector<CodeRange> parseExitCodes(const json& obj, const std::string& where) {
        if (!obj.is_object()) {
            throw WorkflowError(where + ": \"exit_codes\" must be an object");
        }
        std::vector<CodeRange> ranges;
        for (const auto& item : obj.items()) {
            auto bounds = parseCodeKey(item.key());
            if (!bounds) {
                throw WorkflowError(where + ": bad exit code key \"" + item.key() + "\"");
            }
            ranges.push_back({bounds->first, bounds->second,
                              parseRoute(item.value(), where + " code " + item.key())});
        }

        std::sort(ranges.begin(), ranges.end(),
                  [](const CodeRange& a, const CodeRange& b) { return a.low < b.low; });
        for (std::size_t i = 1; i < ranges.size(); ++i) {
            if (ranges[i].low <= ranges[i - 1].high) {
                throw WorkflowError(where + ": overlapping exit codes at " + std::to_string(ranges[i].low));
            }
        }
        return ranges;
    }

    Route parseRoute(const json& obj, const std::string& where) {
        if (!obj.is_object() || obj.size() != 1) {
            throw WorkflowError(where + ": route must name exactly one of link, chain, outcome");
        }

        Route route;
        if (obj.contains("outcome")) {
            std::string name = stringField(obj, "outcome", where, true);
            route.outcome = parseOutcome(name);
            if (!route.outcome) {
                throw WorkflowError(where + ": unknown outcome \"" + name + "\"");
            }
        } else if (obj.contains("link")) {
            route.link = stringField(obj, "link", where, true);
            if (linkIds_.count(route.link) == 0) {
                throw UnknownLinkError(route.link);
            }
        } else if (obj.contains("chain")) {
            std::string chainId = stringField(obj, "chain", where, true);
            auto it = chains_.find(chainId);
            if (it == chains_.end()) {
                throw UnknownLinkError(chainId);
            }
            route.link = it->second.links.front();
        } else {
            throw WorkflowError(where + ": route must name exactly one of link, chain, outcome");
        }
        return route;
    }

    const json& doc_;
    std::map<ChainId, Chain>& chains_;
    std::map<LinkId, Link>& links_;
    std::set<LinkId> linkIds_;
};

}

const Route& Link::route(int exitCode) const noexcept {
    for (const auto& range : exitCodes) {
        if (exitCode < range.low) break;
        if (exitCode <= range.high) return range.route;
    }
    return fallback;
}

const Route& Link::choose(const std::string& value) const noexcept {
    if (const auto* decision = std::get_if<DecisionAction>(&action)) {
        auto it = decision->choices.find(value);
        if (it != decision->choices.end()) {
            return it->second;
        }
    }
    return fallback;
}

const char* Link::actionName() const noexcept {
    switch (action.index()) {
        case 0: return "run";
        case 1: return "set_variable";
        case 2: return "decision";
        default: return "noop";
    }
}

std::shared_ptr<const Workflow> Workflow::load(const std::filesystem::path& path) {
    auto content = readFile(path);
    if (!content) {
        throw WorkflowError("Cannot read workflow file: " + path.string());
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        throw WorkflowError("Invalid JSON in " + path.string() + ": " + e.what());
    }

    auto workflow = parse(doc);
    LOG_INFO("Workflow loaded from " + path.string() + ": " + std::to_string(workflow->links().size()) +
             " links in " + std::to_string(workflow->chains().size()) + " chains");
    return workflow;
}

std::shared_ptr<const Workflow> Workflow::parse(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw WorkflowError("Workflow document must be a JSON object");
    }

    auto versionIt = doc.find("version");
    if (versionIt != doc.end() && (!versionIt->is_number_integer() || versionIt->get<std::int64_t>() != kVersion)) {
        throw WorkflowError("Unsupported workflow version: " + dumpJson(*versionIt));
    }

    std::shared_ptr<Workflow> workflow(new Workflow());
    try {
        Parser parser(doc, workflow->chains_, workflow->links_);
        parser.parseChains();
        parser.parseLinks();
        parser.checkChains();

        workflow->entryChain_ = stringField(doc, "entry_chain", "workflow", true);
    } catch (const nlohmann::json::exception& e) {
        throw WorkflowError(std::string("Malformed workflow: ") + e.what());
    }

    if (workflow->chains_.count(workflow->entryChain_) == 0) {
        throw UnknownLinkError(workflow->entryChain_);
    }

    for (const auto& [chainId, chain] : workflow->chains_) {
        for (const auto& linkId : chain.links) {
            workflow->chainOfLink_.emplace(linkId, chainId);
        }
    }

    for (const auto& linkId : workflow->unreachableLinks()) {
        LOG_WARN("Workflow link is unreachable from the entry chain: " + linkId);
    }
    return workflow;
}

const Link& Workflow::resolve(const LinkId& id) const {
    const Link* link = find(id);
    if (link == nullptr) {
        throw UnknownLinkError(id);
    }
    return *link;
}

const Link* Workflow::find(const LinkId& id) const noexcept {
    auto it = links_.find(id);
    return it == links_.end() ? nullptr : &it->second;
}

const Chain& Workflow::entryChain() const noexcept {
    // parse() guarantees the entry chain exists
    return chains_.find(entryChain_)->second;
}

const LinkId& Workflow::entryLink() const noexcept {
    return entryChain().links.front();
}

const Chain* Workflow::chain(const ChainId& id) const noexcept {
    auto it = chains_.find(id);
    return it == chains_.end() ? nullptr : &it->second;
}

const Chain* Workflow::chainOf(const LinkId& id) const noexcept {
    auto it = chainOfLink_.find(id);
    return it == chainOfLink_.end() ? nullptr : chain(it->second);
}

std::vector<LinkId> Workflow::unreachableLinks() const {
    std::set<LinkId> seen;
    std::deque<LinkId> pending{entryLink()};

    auto visit = [&](const Route& route) {
        if (!route.isTerminal() && seen.count(route.link) == 0) {
            pending.push_back(route.link);
        }
    };

    while (!pending.empty()) {
        LinkId id = pending.front();
        pending.pop_front();
        if (!seen.insert(id).second) {
            continue;
        }
        const Link* link = find(id);
        if (link == nullptr) {
            continue;
        }
        for (const auto& range : link->exitCodes) visit(range.route);
        if (const auto* decision = std::get_if<DecisionAction>(&link->action)) {
            for (const auto& choice : decision->choices) visit(choice.second);
        }
        visit(link->fallback);
    }

    std::vector<LinkId> unreachable;
    for (const auto& entry : links_) {
        if (seen.count(entry.first) == 0) {
            unreachable.push_back(entry.first);
        }
    }
    return unreachable;
}

}
