// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <memory>
#include <string>

#include "common/gtest_utils.hpp"
#include "config.hpp"
#include "json_utils.hpp"
#include "object.hpp"
#include "pattern_registry.hpp"
#include "security_result.hpp"
#include "validator.hpp"
#include "violation.hpp"

using namespace jsentry;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StartsWith;

namespace {

TEST(TestValidator, ValidateObject)
{
    const validator engine;

    auto result = engine.validate(test::json(R"({"name":"alice","bio":"hello"})"));
    EXPECT_TRUE(result.is_valid());

    result = engine.validate(test::json(R"({"name":"Robert'); DROP TABLE students;--"})"));
    EXPECT_FALSE(result.is_valid());
    EXPECT_THAT(result.violations,
        ElementsAre(test::IsViolation(violation_kind::sql_injection, "$.name")));
    EXPECT_EQ(result.count(violation_kind::sql_injection), 1);
}

TEST(TestValidator, ValidateWithPreset)
{
    const validator engine;
    auto root = test::json(R"({"a":{"b":{"c":{"d":{"e":{"f":1}}}}}})");

    EXPECT_TRUE(engine.validate(root).is_valid());
    EXPECT_THAT(engine.validate(root, strict_preset()).violations,
        ElementsAre(test::IsViolation(violation_kind::depth_limit_exceeded, "$.a.b.c.d.e.f")));
}

TEST(TestValidator, ValidateText)
{
    const validator engine;

    EXPECT_TRUE(engine.validate_text(R"({"ok":[1,2,3]})").is_valid());

    auto result = engine.validate_text(R"({"path":"../../etc/passwd"})");
    EXPECT_THAT(result.violations,
        ElementsAre(test::IsViolation(violation_kind::path_traversal, "$.path")));
}

TEST(TestValidator, ValidateMalformedText)
{
    const validator engine;

    auto result = engine.validate_text(R"({"a":1,)");
    ASSERT_THAT(result.violations, ElementsAre(test::IsViolation(violation_kind::invalid_unicode, "$")));
    EXPECT_THAT(result.violations[0].message, StartsWith("Invalid JSON: "));

    result = engine.validate_text("");
    EXPECT_THAT(result.violations, ElementsAre(test::IsViolation(violation_kind::invalid_unicode, "$")));

    result = engine.validate_text("\"\xff\"");
    EXPECT_THAT(result.violations, ElementsAre(test::IsViolation(violation_kind::invalid_unicode, "$")));
}

TEST(TestValidator, ValidateOversizedText)
{
    const validator engine;
    validation_config config;
    config.max_total_size_bytes = 16;

    // Not parsed, only the size is reported
    auto result = engine.validate_text(R"({"text":"<script>alert(1)</script>"})", config);
    ASSERT_THAT(result.violations,
        ElementsAre(test::IsViolation(violation_kind::size_limit_exceeded, "$")));
    EXPECT_STR(result.violations[0].message, "Total JSON size exceeds 16 bytes");

    result = engine.validate_text("{not json at all}", config);
    EXPECT_THAT(result.violations,
        ElementsAre(test::IsViolation(violation_kind::size_limit_exceeded, "$")));
}

TEST(TestValidator, ValidateDeeplyNestedText)
{
    const validator engine;

    const std::size_t depth = 100'000;
    std::string text(depth, '[');
    text.append(depth, ']');

    validation_config config;
    config.max_total_size_bytes = text.size();

    auto result = engine.validate_text(text, config);
    ASSERT_EQ(result.violations.size(), 1);
    EXPECT_EQ(result.violations[0].kind, violation_kind::depth_limit_exceeded);

    std::string expected_path = "$";
    for (std::size_t i = 0; i <= config.max_depth; ++i) { expected_path.append("[0]"); }
    EXPECT_STR(result.violations[0].path, expected_path);
}

TEST(TestValidator, Sanitize)
{
    const validator engine;
    auto root = test::json(R"({"__proto__":{"x":1},"name":"<b>x</b>"})");

    EXPECT_EQ(engine.sanitize(root), test::json(R"({"name":"&lt;b&gt;x&lt;/b&gt;"})"));
    EXPECT_EQ(engine.sanitize(root, {}, false),
        test::json(R"({"__proto__":{"x":1},"name":"&lt;b&gt;x&lt;/b&gt;"})"));
}

TEST(TestValidator, HashAndVerify)
{
    auto root = test::json(R"({"b":2,"a":1})");
    auto digest = validator::hash(root);

    EXPECT_EQ(digest.size(), 64);
    EXPECT_STR(digest, validator::hash(test::json(R"({"a":1,"b":2})")));
    EXPECT_TRUE(validator::verify(root, digest));
    EXPECT_FALSE(validator::verify(test::json(R"({"a":1})"), digest));
}

TEST(TestValidator, SerializeCanonical)
{
    const validator engine;

    auto result = engine.serialize(test::json(R"({"z":1,"a":[true,null],"m":"x"})"));
    ASSERT_TRUE(result.has_value());
    EXPECT_STR(*result, R"({"a":[true,null],"m":"x","z":1})");
}

TEST(TestValidator, SerializeSanitizesFirst)
{
    const validator engine;
    auto root = test::json(R"({"constructor":"x","html":"<script>alert(1)</script>"})");

    auto result = engine.serialize(root);
    ASSERT_TRUE(result);
    EXPECT_STR(result.value(),
        R"({"html":"&lt;script&gt;alert(1)&lt;/script&gt;"})");

    auto unsanitized = engine.serialize(root, {}, false);
    ASSERT_FALSE(unsanitized);
    EXPECT_THAT(unsanitized.error().violations(),
        ElementsAre(test::IsViolation(violation_kind::dangerous_key, "$.constructor"),
            test::IsViolation(violation_kind::script_injection, "$.html")));
}

TEST(TestValidator, SerializeRejectsRemainingViolations)
{
    const validator engine;

    // Escaping leaves the scheme untouched
    auto result = engine.serialize(test::json(R"x({"link":"javascript:void(0)"})x"));
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().violations(),
        ElementsAre(test::IsViolation(violation_kind::script_injection, "$.link")));
    EXPECT_STR(result.error().what(), "security violations detected: 1 issues");
    EXPECT_THROW((void)result.value(), security_error);
}

TEST(TestValidator, SerializeRelaxedKeepsViolations)
{
    const validator engine;
    auto config = relaxed_preset();

    config.max_string_length = 10;

    auto result = engine.serialize(test::json(R"x({"link":"javascript:void(0)"})x"), config);
    ASSERT_TRUE(result.has_value());
    EXPECT_STR(*result, R"x({"link":"javascript:void(0)"})x");
    EXPECT_THAT(result.warnings(),
        ElementsAre(test::IsViolation(violation_kind::size_limit_exceeded, "$.link")));

    auto clean = engine.serialize(test::json(R"({"link":"/home"})"), config);
    ASSERT_TRUE(clean.has_value());
    EXPECT_THAT(clean.warnings(), IsEmpty());
}

TEST(TestValidator, SerializeChecksOutputSize)
{
    const validator engine;
    validation_config config;
    config.max_total_size_bytes = 10;

    auto result = engine.serialize(test::json(R"({"long":"0123456789"})"), config);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().violations(),
        ElementsAre(test::IsViolation(violation_kind::size_limit_exceeded, "$")));

    EXPECT_TRUE(engine.serialize(test::json("[1]"), config).has_value());
}

TEST(TestValidator, DeserializeValid)
{
    const validator engine;

    auto result = engine.deserialize(R"({"name":"bob","tags":["a","b"]})");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, test::json(R"({"name":"bob","tags":["a","b"]})"));
}

TEST(TestValidator, DeserializeStrictRejects)
{
    const validator engine;

    auto result = engine.deserialize(R"({"q":"1 UNION SELECT password FROM users"})");
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().violations(),
        ElementsAre(test::IsViolation(violation_kind::sql_injection, "$.q")));
}

TEST(TestValidator, DeserializeRelaxedAccepts)
{
    const validator engine;
    auto config = relaxed_preset();

    auto result = engine.deserialize(R"({"__proto__":"<b>x</b>"})", config);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, test::json(R"({"__proto__":"<b>x</b>"})"));

    EXPECT_THAT(result.warnings(), IsEmpty());

    auto sanitized = engine.deserialize(R"({"__proto__":"<b>x</b>"})", config, true);
    ASSERT_TRUE(sanitized.has_value());
    EXPECT_EQ(*sanitized, test::json(R"({"__proto__":"&lt;b&gt;x&lt;/b&gt;"})"));

    config.max_string_length = 4;
    auto warned = engine.deserialize(R"({"__proto__":"<b>x</b>"})", config);
    ASSERT_TRUE(warned.has_value());
    EXPECT_EQ(*warned, test::json(R"({"__proto__":"<b>x</b>"})"));
    EXPECT_THAT(warned.warnings(),
        ElementsAre(test::IsViolation(violation_kind::size_limit_exceeded, "$.__proto__")));
}

TEST(TestValidator, DeserializeStrictDoesNotSanitize)
{
    const validator engine;

    auto result = engine.deserialize(R"({"n":"O'Brien"})", strict_preset(), true);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, test::json(R"({"n":"O'Brien"})"));
    EXPECT_THAT(result.warnings(), IsEmpty());
}

TEST(TestValidator, DeserializeRelaxedKeepsDeepContent)
{
    const validator engine;
    const auto config = relaxed_preset();

    // 23 levels against a maximum depth of 20
    std::string text(23, '[');
    text.append("1");
    text.append(23, ']');

    auto result = engine.deserialize(text, config);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, test::json(text));
    EXPECT_STR(object_to_json(*result), text);

    std::string path{"$"};
    for (std::size_t i = 0; i < 21; ++i) {
        path.append("[0]");
    }
    EXPECT_THAT(result.warnings(),
        ElementsAre(test::IsViolation(violation_kind::depth_limit_exceeded, path)));

    auto sanitized = engine.deserialize(text, config, true);
    ASSERT_TRUE(sanitized.has_value());
    EXPECT_STR(object_to_json(*sanitized), text);
}

TEST(TestValidator, DeserializeRejectsDocumentsTooDeepToKeep)
{
    const validator engine;

    std::string text(600, '[');
    text.append(600, ']');

    auto result = engine.deserialize(text, relaxed_preset());
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().violations(),
        ElementsAre(test::IsViolation(violation_kind::depth_limit_exceeded, "$")));
    EXPECT_STR(result.error().what(), "JSON nesting exceeds 512 levels");
}

TEST(TestValidator, DeserializeRelaxedStillRejectsMalformed)
{
    const validator engine;
    auto config = relaxed_preset();

    auto result = engine.deserialize("[1,2", config);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().violations(),
        ElementsAre(test::IsViolation(violation_kind::invalid_unicode, "$")));
    EXPECT_THAT(result.error().what(), StartsWith("Invalid JSON: "));

    config.max_total_size_bytes = 2;
    result = engine.deserialize("[1]", config);
    ASSERT_FALSE(result.has_value());
    EXPECT_STR(result.error().what(), "Total JSON size exceeds 2 bytes");
}

TEST(TestValidator, DeserializeValueThrows)
{
    const validator engine;
    auto result = engine.deserialize(R"({"$where":"1"})");

    try {
        (void)result.value();
        FAIL() << "security_error expected";
    } catch (const security_error &e) {
        EXPECT_THAT(e.violations(),
            ElementsAre(test::IsViolation(violation_kind::dangerous_key, "$.$where")));
    }
}

TEST(TestValidator, CustomRegistry)
{
    pattern_registry::pattern_lists lists;
    lists.dangerous_keys = {"^secret$"};
    lists.script_injection = {"forbidden"};

    const validator engine{std::make_shared<pattern_registry>(lists)};
    auto result = engine.validate(
        test::json(R"({"secret":1,"__proto__":"forbidden word","x":"<script>alert(1)</script>"})"));

    EXPECT_THAT(result.violations,
        ElementsAre(test::IsViolation(violation_kind::dangerous_key, "$.secret"),
            test::IsViolation(violation_kind::script_injection, "$.__proto__")));
    EXPECT_THAT(engine.registry().patterns(pattern_category::sql_injection), IsEmpty());
}

TEST(TestValidator, ReportDocument)
{
    const validator engine;
    auto result = engine.validate(test::json(R"({"__proto__":1})"));

    EXPECT_STR(result_to_json(result),
        R"({"valid":false,"violations":[{"kind":"dangerous_key","severity":"critical",)"
        R"("path":"$.__proto__","message":"Dangerous key pattern detected: __proto__",)"
        R"("snippet":"__proto__"}]})");

    EXPECT_STR(result_to_json(engine.validate(object::make_map())),
        R"({"valid":true,"violations":[]})");
}

} // namespace
