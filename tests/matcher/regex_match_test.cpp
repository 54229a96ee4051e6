// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "common/gtest_utils.hpp"
#include "exception.hpp"
#include "matcher/regex_match.hpp"

using namespace jsentry;
using namespace jsentry::matcher;

namespace {
TEST(TestRegexMatch, TestBasicCaseInsensitive)
{
    const regex_match matcher("^rEgEx$", false);
    EXPECT_STR(matcher.to_string(), "^rEgEx$");
    EXPECT_STR(matcher.name(), "match_regex");

    auto [res, highlight] = matcher.match("regex");
    EXPECT_TRUE(res);
    EXPECT_STR(highlight, "regex");
}

TEST(TestRegexMatch, TestBasicCaseSensitive)
{
    const regex_match matcher("^rEgEx$", true);

    EXPECT_FALSE(matcher.match("regex").first);

    auto [res, highlight] = matcher.match("rEgEx");
    EXPECT_TRUE(res);
    EXPECT_STR(highlight, "rEgEx");
}

TEST(TestRegexMatch, TestUnanchoredHighlight)
{
    const regex_match matcher(R"(union\s+select)", false);

    auto [res, highlight] = matcher.match("1 UNION  SELECT 2");
    EXPECT_TRUE(res);
    EXPECT_STR(highlight, "UNION  SELECT");
    EXPECT_TRUE(matcher.search("1 UNION  SELECT 2"));
}

TEST(TestRegexMatch, TestDotMatchesNewline)
{
    const regex_match single_line("a.b", false);
    EXPECT_FALSE(single_line.search("a\nb"));

    const regex_match multi_line("a.b", false, true);
    EXPECT_TRUE(multi_line.search("a\nb"));
}

TEST(TestRegexMatch, TestEmptyInput)
{
    const regex_match matcher(".*", false);
    EXPECT_FALSE(matcher.match("").first);
    EXPECT_FALSE(matcher.search(""));
}

TEST(TestRegexMatch, TestBinaryInput)
{
    const regex_match matcher("b", false);
    EXPECT_TRUE(matcher.search(std::string_view{"a\0b", 3}));
}

TEST(TestRegexMatch, TestInvalidRegex)
{
    EXPECT_THROW(regex_match("[a-", false), parsing_error);
    EXPECT_THROW(regex_match("(?<!lookbehind)", false), parsing_error);
}

} // namespace
