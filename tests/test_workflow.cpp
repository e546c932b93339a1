/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/workflow.hpp"

#include <gtest/gtest.h>

using namespace archivist;

namespace {

nlohmann::json minimalWorkflow() {
    return nlohmann::json::parse(R"({
        "version": 1,
        "entry_chain": "main",
        "chains": {"main": {"links": ["check", "pick", "finish"]}},
        "links": {
            "check": {
                "group": "Verify",
                "action": {"type": "run", "command": "test", "arguments": "-d %SIPObjectsDirectory%"},
                "exit_codes": {"0": {"link": "pick"}, "2..9": {"outcome": "reject"}},
                "fallback": {"outcome": "fail"}
            },
            "pick": {
                "action": {"type": "decision", "option": "normalize"},
                "choices": {"true": {"link": "finish"}, "false": {"outcome": "complete"}},
                "fallback": {"outcome": "fail"}
            },
            "finish": {
                "action": {"type": "noop"},
                "fallback": {"outcome": "complete"}
            }
        }
    })");
}

}

TEST(workflow, parse_minimal_graph) {
    // act
    auto workflow = Workflow::parse(minimalWorkflow());

    // assert
    ASSERT_NE(workflow, nullptr);
    EXPECT_EQ(workflow->entryChain().id, "main");
    EXPECT_EQ(workflow->entryLink(), "check");
    EXPECT_EQ(workflow->links().size(), 3u);
    EXPECT_STREQ(workflow->resolve("check").actionName(), "run");
    EXPECT_STREQ(workflow->resolve("pick").actionName(), "decision");
    EXPECT_STREQ(workflow->resolve("finish").actionName(), "noop");
    ASSERT_NE(workflow->chainOf("pick"), nullptr);
    EXPECT_EQ(workflow->chainOf("pick")->id, "main");
    EXPECT_TRUE(workflow->unreachableLinks().empty());
}

TEST(workflow, exit_code_routing_uses_ranges_then_fallback) {
    // arrange
    auto workflow = Workflow::parse(minimalWorkflow());
    const Link& check = workflow->resolve("check");

    // act & assert
    EXPECT_EQ(check.route(0).link, "pick");
    EXPECT_EQ(check.route(2).outcome, Outcome::Reject);
    EXPECT_EQ(check.route(9).outcome, Outcome::Reject);
    EXPECT_EQ(check.route(1).outcome, Outcome::Fail);
    EXPECT_EQ(check.route(-1).outcome, Outcome::Fail);
    EXPECT_EQ(check.route(137).outcome, Outcome::Fail);
}

TEST(workflow, decision_choices_and_fallback) {
    // arrange
    auto workflow = Workflow::parse(minimalWorkflow());
    const Link& pick = workflow->resolve("pick");

    // act & assert
    EXPECT_EQ(pick.choose("true").link, "finish");
    EXPECT_EQ(pick.choose("false").outcome, Outcome::Complete);
    EXPECT_EQ(pick.choose("maybe").outcome, Outcome::Fail);
}

TEST(workflow, missing_fallback_fails_validation) {
    // arrange
    auto doc = minimalWorkflow();
    doc["links"]["check"].erase("fallback");

    // act & assert
    EXPECT_THROW((void)Workflow::parse(doc), WorkflowError);
}

TEST(workflow, route_to_unknown_link_fails_at_load) {
    // arrange
    auto doc = minimalWorkflow();
    doc["links"]["check"]["exit_codes"]["0"] = {{"link", "nowhere"}};

    // act & assert
    try {
        (void)Workflow::parse(doc);
        FAIL() << "expected UnknownLinkError";
    } catch (const UnknownLinkError& e) {
        EXPECT_EQ(e.id(), "nowhere");
    }
}

TEST(workflow, chain_lists_unknown_link) {
    // arrange
    auto doc = minimalWorkflow();
    doc["chains"]["main"]["links"].push_back("ghost");

    // act & assert
    EXPECT_THROW((void)Workflow::parse(doc), UnknownLinkError);
}

TEST(workflow, unknown_entry_chain) {
    // arrange
    auto doc = minimalWorkflow();
    doc["entry_chain"] = "other";

    // act & assert
    EXPECT_THROW((void)Workflow::parse(doc), UnknownLinkError);
}

TEST(workflow, overlapping_exit_codes_rejected) {
    // arrange
    auto doc = minimalWorkflow();
    doc["links"]["check"]["exit_codes"]["5"] = {{"outcome", "fail"}};

    // act & assert
    EXPECT_THROW((void)Workflow::parse(doc), WorkflowError);
}

TEST(workflow, decision_on_unknown_option_rejected) {
    // arrange
    auto doc = minimalWorkflow();
    doc["links"]["pick"]["action"]["option"] = "normalise";

    // act & assert
    EXPECT_THROW((void)Workflow::parse(doc), WorkflowError);
}

TEST(workflow, decision_choice_must_be_option_value) {
    // arrange
    auto doc = minimalWorkflow();
    doc["links"]["pick"]["choices"]["yes"] = {{"outcome", "complete"}};

    // act & assert
    EXPECT_THROW((void)Workflow::parse(doc), WorkflowError);
}

TEST(workflow, malformed_links_rejected) {
    auto unknownType = minimalWorkflow();
    unknownType["links"]["finish"]["action"]["type"] = "email";
    EXPECT_THROW((void)Workflow::parse(unknownType), WorkflowError);

    auto escaping = minimalWorkflow();
    escaping["links"]["check"]["action"]["filter_subdir"] = "../other";
    EXPECT_THROW((void)Workflow::parse(escaping), WorkflowError);

    auto badQuote = minimalWorkflow();
    badQuote["links"]["check"]["action"]["arguments"] = "\"unterminated";
    EXPECT_THROW((void)Workflow::parse(badQuote), WorkflowError);

    auto twoTargets = minimalWorkflow();
    twoTargets["links"]["finish"]["fallback"] = {{"outcome", "complete"}, {"link", "check"}};
    EXPECT_THROW((void)Workflow::parse(twoTargets), WorkflowError);

    auto badOutcome = minimalWorkflow();
    badOutcome["links"]["finish"]["fallback"] = {{"outcome", "done"}};
    EXPECT_THROW((void)Workflow::parse(badOutcome), WorkflowError);
}

TEST(workflow, version_must_match_exactly) {
    // arrange
    auto wrapped = minimalWorkflow();
    wrapped["version"] = 4294967297LL;
    auto textual = minimalWorkflow();
    textual["version"] = "1";

    // act & assert
    EXPECT_THROW((void)Workflow::parse(wrapped), WorkflowError);
    EXPECT_THROW((void)Workflow::parse(textual), WorkflowError);
    EXPECT_NO_THROW((void)Workflow::parse(minimalWorkflow()));
}

TEST(workflow, chain_route_resolves_to_first_link) {
    // arrange
    auto doc = minimalWorkflow();
    doc["chains"]["tail"] = {{"links", nlohmann::json::array({"finish"})}};
    doc["links"]["pick"]["choices"]["false"] = {{"chain", "tail"}};

    // act
    auto workflow = Workflow::parse(doc);

    // assert
    EXPECT_EQ(workflow->resolve("pick").choose("false").link, "finish");
}

TEST(workflow, reports_unreachable_links) {
    // arrange
    auto doc = minimalWorkflow();
    doc["links"]["orphan"] = {{"action", {{"type", "noop"}}}, {"fallback", {{"outcome", "complete"}}}};

    // act
    auto workflow = Workflow::parse(doc);

    // assert
    EXPECT_EQ(workflow->unreachableLinks(), std::vector<LinkId>{"orphan"});
}

TEST(workflow, resolve_unknown_link_throws) {
    // arrange
    auto workflow = Workflow::parse(minimalWorkflow());

    // act & assert
    EXPECT_THROW((void)workflow->resolve("nope"), UnknownLinkError);
    EXPECT_EQ(workflow->find("nope"), nullptr);
}

TEST(workflow, load_sample_workflow) {
    // act
    auto workflow = Workflow::load(ARCHIVIST_SAMPLE_WORKFLOW);

    // assert
    EXPECT_EQ(workflow->entryLink(), "verify-objects");
    EXPECT_TRUE(workflow->unreachableLinks().empty());
}

TEST(workflow, load_missing_file_throws) {
    EXPECT_THROW((void)Workflow::load("/nonexistent/workflow.json"), WorkflowError);
}
