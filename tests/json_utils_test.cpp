// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <limits>
#include <string>
#include <string_view>

#include "common/gtest_utils.hpp"
#include "json_utils.hpp"
#include "object.hpp"
#include "violation.hpp"

using namespace jsentry;
using namespace std::literals;

namespace {

TEST(TestJsonUtils, ParseDocument)
{
    auto parsed = json_to_object(R"({"a":1,"b":[true,null,"x"],"c":-2.5,"d":{}})");
    ASSERT_TRUE(parsed.ok());
    EXPECT_FALSE(parsed.clipped);

    const auto &root = parsed.value;
    ASSERT_TRUE(root.is_map());
    EXPECT_EQ(root.size(), 4);

    const auto *a = root.find("a");
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->is_number());
    EXPECT_EQ(a->as<double>(), 1.0);

    const auto *b = root.find("b");
    ASSERT_NE(b, nullptr);
    ASSERT_TRUE(b->is_array());
    EXPECT_TRUE(b->at(0).as<bool>());
    EXPECT_TRUE(b->at(1).is_null());
    EXPECT_STR(b->at(2).as<std::string_view>(), "x");

    EXPECT_EQ(root.find("c")->as<double>(), -2.5);
    EXPECT_TRUE(root.find("d")->is_map());
}

TEST(TestJsonUtils, ParseKeepsKeyOrderAndReplacesDuplicates)
{
    auto parsed = json_to_object(R"({"z":1,"a":2,"z":3})");
    ASSERT_TRUE(parsed.ok());

    const auto &map = parsed.value.as_map();
    ASSERT_EQ(map.size(), 2);
    EXPECT_STR(map[0].first, "z");
    EXPECT_EQ(map[0].second.as<double>(), 3.0);
    EXPECT_STR(map[1].first, "a");
}

TEST(TestJsonUtils, ParseStringWithNul)
{
    auto parsed = json_to_object(R"({"a":"x\u0000y"})");
    ASSERT_TRUE(parsed.ok());
    EXPECT_STR(parsed.value.find("a")->as<std::string_view>(), "x\0y"sv);
}

TEST(TestJsonUtils, ParseKeepsInvalidUTF8Bytes)
{
    auto parsed = json_to_object("\"a\xFF\"");
    ASSERT_TRUE(parsed.ok());
    EXPECT_STR(parsed.value.as<std::string_view>(), "a\xFF");
}

TEST(TestJsonUtils, ParseScalarRoot)
{
    auto parsed = json_to_object("42");
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.value.as<double>(), 42.0);
}

TEST(TestJsonUtils, MalformedInput)
{
    for (auto text : {""sv, "{"sv, R"({"a":})"sv, "[1,2"sv, "{} []"sv, "nope"sv}) {
        auto parsed = json_to_object(text);
        EXPECT_FALSE(parsed.ok()) << text;
        EXPECT_FALSE(parsed.error.empty()) << text;
        EXPECT_TRUE(parsed.value.is_null()) << text;
    }
}

TEST(TestJsonUtils, DeepContentIsClipped)
{
    // A maximum depth of 1 materialises containers up to depth 2
    auto parsed = json_to_object("[[[[1]],2]]", 1);
    ASSERT_TRUE(parsed.ok());
    EXPECT_TRUE(parsed.clipped);

    const auto &level1 = parsed.value.at(0);
    ASSERT_EQ(level1.size(), 2);
    EXPECT_TRUE(level1.at(0).is_array());
    EXPECT_EQ(level1.at(0).size(), 0);
    EXPECT_EQ(level1.at(1).as<double>(), 2.0);
}

TEST(TestJsonUtils, VeryDeepInputDoesNotExhaustTheStack)
{
    std::string text(100000, '[');
    text.append(100000, ']');

    auto parsed = json_to_object(text, 10);
    ASSERT_TRUE(parsed.ok());
    EXPECT_TRUE(parsed.clipped);
}

TEST(TestJsonUtils, DocumentKeepsEveryLevel)
{
    // The leaf sits at depth 512
    std::string text(512, '[');
    text.append("1");
    text.append(512, ']');

    auto parsed = json_to_document(text);
    ASSERT_TRUE(parsed.ok());
    EXPECT_FALSE(parsed.clipped);
    EXPECT_STR(object_to_json(parsed.value), text);
}

TEST(TestJsonUtils, DocumentTooDeepFails)
{
    std::string text(513, '[');
    text.append(513, ']');

    auto parsed = json_to_document(text);
    EXPECT_FALSE(parsed.ok());
    EXPECT_TRUE(parsed.clipped);
    EXPECT_TRUE(parsed.value.is_null());
    EXPECT_STR(parsed.error, "nesting exceeds 512 levels");

    auto error = parse_violation(parsed);
    EXPECT_EQ(error.kind, violation_kind::depth_limit_exceeded);
    EXPECT_STR(error.path, "$");
    EXPECT_STR(error.message, "JSON nesting exceeds 512 levels");

    auto malformed = parse_violation(json_to_document("[1,"));
    EXPECT_EQ(malformed.kind, violation_kind::invalid_unicode);
    EXPECT_THAT(malformed.message, ::testing::StartsWith("Invalid JSON: "));
}

TEST(TestJsonUtils, SerializeInsertionOrder)
{
    auto root = test::json(R"({"b":1,"a":[true,null,"x"]})");
    EXPECT_EQ(object_to_json(root), R"({"b":1,"a":[true,null,"x"]})");
}

TEST(TestJsonUtils, SerializeCanonicalSortsKeys)
{
    auto root = test::json(R"({"b":{"z":1,"y":2},"a":[{"d":0,"c":0}],"B":true})");
    EXPECT_EQ(object_to_json(root, true), R"({"B":true,"a":[{"c":0,"d":0}],"b":{"y":2,"z":1}})");
}

TEST(TestJsonUtils, SerializeNumbers)
{
    auto root = object::make_array();
    root.emplace_back(object::make_float(3.0));
    root.emplace_back(object::make_float(-7.0));
    root.emplace_back(object::make_float(-0.0));
    root.emplace_back(object::make_float(1.5));
    root.emplace_back(object::make_float(0.1));
    EXPECT_EQ(object_to_json(root), "[3,-7,0,1.5,0.1]");

    auto special = object::make_array();
    special.emplace_back(object::make_float(std::numeric_limits<double>::quiet_NaN()));
    special.emplace_back(object::make_float(std::numeric_limits<double>::infinity()));
    special.emplace_back(object::make_float(-std::numeric_limits<double>::infinity()));
    EXPECT_EQ(object_to_json(special), "[NaN,Infinity,-Infinity]");
}

TEST(TestJsonUtils, SerializeEscapesStrings)
{
    auto root = object::make_string("a\"b\\c\0d"s);
    EXPECT_EQ(object_to_json(root), R"("a\"b\\c\u0000d")");
}

TEST(TestJsonUtils, SerializeCycleAsNull)
{
    auto root = object::make_map();
    root.emplace("name", object::make_string("loop"));
    root.emplace("self", root);

    EXPECT_EQ(object_to_json(root, true), R"({"name":"loop","self":null})");

    // Break the cycle so the map can be released
    root.emplace("self", object{});
}

TEST(TestJsonUtils, ResultReport)
{
    validation_result result;
    EXPECT_EQ(result_to_json(result), R"({"valid":true,"violations":[]})");

    result.violations.emplace_back(violation::make(
        violation_kind::sql_injection, "SQL injection pattern detected", "$.q", "' OR 1=1"));
    result.violations.emplace_back(
        violation::make(violation_kind::depth_limit_exceeded, "Nesting depth exceeds 1", "$.a.b"));

    EXPECT_EQ(result_to_json(result),
        R"({"valid":false,"violations":[)"
        R"({"kind":"sql_injection","severity":"critical","path":"$.q",)"
        R"("message":"SQL injection pattern detected","snippet":"' OR 1=1"},)"
        R"({"kind":"depth_limit_exceeded","severity":"high","path":"$.a.b",)"
        R"("message":"Nesting depth exceeds 1"}]})");
}

} // namespace
