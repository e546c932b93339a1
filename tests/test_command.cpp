/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/command.hpp"

#include <gtest/gtest.h>

using namespace archivist;

TEST(command, split_plain_words) {
    // act
    auto words = splitArguments("  -a   --flag value ");

    // assert
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (std::vector<std::string>{"-a", "--flag", "value"}));
}

TEST(command, split_quotes_and_escapes) {
    // act
    auto words = splitArguments(R"(one "two words" 'it''s' "say \"hi\"" back\ slash "")");

    // assert
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (std::vector<std::string>{"one", "two words", "its", "say \"hi\"", "back slash", ""}));
}

TEST(command, split_single_quotes_are_literal) {
    // act
    auto words = splitArguments(R"('a\"b' "%x%")");

    // assert
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (std::vector<std::string>{"a\\\"b", "%x%"}));
}

TEST(command, split_unterminated_quote_fails) {
    EXPECT_FALSE(splitArguments("\"open").has_value());
    EXPECT_FALSE(splitArguments("it's").has_value());
}

TEST(command, expand_known_and_unknown_tokens) {
    // arrange
    Replacements values{{"SIPUUID", "abc"}, {"fileName", "report"}};

    // act
    std::string out = expand("%SIPUUID%/%fileName%.%unknown%", values);

    // assert
    EXPECT_EQ(out, "abc/report.%unknown%");
}

TEST(command, expand_percent_next_to_token) {
    // arrange
    Replacements values{{"fileUUID", "f1"}};

    // act & assert
    EXPECT_EQ(expand("100%%fileUUID%", values), "100%f1");
    EXPECT_EQ(expand("50% done", values), "50% done");
}

TEST(command, expand_arguments_keeps_values_whole) {
    // arrange
    Replacements values{{"inputFile", "/work/objects/my file.txt"}};

    // act
    auto args = expandArguments("--in %inputFile% --level 3", values);

    // assert
    ASSERT_TRUE(args.has_value());
    ASSERT_EQ(args->size(), 4u);
    EXPECT_EQ((*args)[1], "/work/objects/my file.txt");
}
