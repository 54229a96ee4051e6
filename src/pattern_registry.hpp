// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "matcher/regex_match.hpp"
#include "violation.hpp"

namespace jsentry {

enum class pattern_category : uint8_t {
    dangerous_key,
    script_injection,
    sql_injection,
    path_traversal,
};

std::string_view to_string(pattern_category category);

// Violation reported when a string value matches an injection category,
// dangerous_key maps to violation_kind::dangerous_key.
violation_kind to_violation_kind(pattern_category category);

struct pattern_match {
    pattern_category category;
    std::size_t index;

    bool operator==(const pattern_match &) const = default;
};

// Compiled, case-insensitive threat patterns grouped by category.
//
// The registry is immutable once built and safe to share between threads.
// Dangerous-key patterns are meant for map keys, the three injection
// categories for string values.
class pattern_registry {
public:
    struct pattern_lists {
        std::vector<std::string> dangerous_keys;
        std::vector<std::string> script_injection;
        std::vector<std::string> sql_injection;
        std::vector<std::string> path_traversal;
    };

    // Injection categories in the order they are evaluated against strings
    static constexpr std::array<pattern_category, 3> injection_categories{
        pattern_category::script_injection, pattern_category::sql_injection,
        pattern_category::path_traversal};

    // Throws parsing_error if any pattern is malformed
    explicit pattern_registry(const pattern_lists &lists = default_patterns());

    ~pattern_registry() = default;
    pattern_registry(const pattern_registry &) = delete;
    pattern_registry(pattern_registry &&) noexcept = default;
    pattern_registry &operator=(const pattern_registry &) = delete;
    pattern_registry &operator=(pattern_registry &&) noexcept = default;

    [[nodiscard]] bool match(std::string_view text, pattern_category category) const
    {
        return find(text, category).has_value();
    }

    // Index of the first pattern of the category matching text
    [[nodiscard]] std::optional<std::size_t> find(
        std::string_view text, pattern_category category) const;

    // First injection category matching text, in injection_categories order
    [[nodiscard]] std::optional<pattern_match> match_any(std::string_view text) const;

    [[nodiscard]] const std::vector<matcher::regex_match> &patterns(
        pattern_category category) const
    {
        return categories_[static_cast<std::size_t>(category)];
    }

    static pattern_lists default_patterns();

    // Process-wide registry built from default_patterns()
    static std::shared_ptr<const pattern_registry> default_registry();

protected:
    std::array<std::vector<matcher::regex_match>, 4> categories_;
};

} // namespace jsentry
