// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "log.hpp"
#include "matcher/regex_match.hpp"
#include "pattern_registry.hpp"
#include "violation.hpp"

namespace jsentry {

namespace {

std::vector<matcher::regex_match> compile(
    const std::vector<std::string> &patterns, bool dot_matches_newline)
{
    std::vector<matcher::regex_match> compiled;
    compiled.reserve(patterns.size());
    for (const auto &pattern : patterns) {
        compiled.emplace_back(pattern, false, dot_matches_newline);
    }
    return compiled;
}

} // namespace

std::string_view to_string(pattern_category category)
{
    switch (category) {
    case pattern_category::dangerous_key:
        return "dangerous_key";
    case pattern_category::script_injection:
        return "script_injection";
    case pattern_category::sql_injection:
        return "sql_injection";
    case pattern_category::path_traversal:
        return "path_traversal";
    }
    return "unknown";
}

violation_kind to_violation_kind(pattern_category category)
{
    switch (category) {
    case pattern_category::dangerous_key:
        return violation_kind::dangerous_key;
    case pattern_category::script_injection:
        return violation_kind::script_injection;
    case pattern_category::sql_injection:
        return violation_kind::sql_injection;
    case pattern_category::path_traversal:
        return violation_kind::path_traversal;
    }
    return violation_kind::script_injection;
}

pattern_registry::pattern_registry(const pattern_lists &lists)
{
    categories_[static_cast<std::size_t>(pattern_category::dangerous_key)] =
        compile(lists.dangerous_keys, false);
    // Script payloads are commonly split across lines
    categories_[static_cast<std::size_t>(pattern_category::script_injection)] =
        compile(lists.script_injection, true);
    categories_[static_cast<std::size_t>(pattern_category::sql_injection)] =
        compile(lists.sql_injection, false);
    categories_[static_cast<std::size_t>(pattern_category::path_traversal)] =
        compile(lists.path_traversal, false);

    JSENTRY_DEBUG("Loaded {} dangerous key, {} script, {} sql and {} path traversal patterns",
        lists.dangerous_keys.size(), lists.script_injection.size(), lists.sql_injection.size(),
        lists.path_traversal.size());
}

std::optional<std::size_t> pattern_registry::find(
    std::string_view text, pattern_category category) const
{
    const auto &matchers = patterns(category);
    for (std::size_t i = 0; i < matchers.size(); ++i) {
        if (matchers[i].search(text)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<pattern_match> pattern_registry::match_any(std::string_view text) const
{
    for (auto category : injection_categories) {
        auto index = find(text, category);
        if (index.has_value()) {
            return pattern_match{category, *index};
        }
    }
    return std::nullopt;
}

pattern_registry::pattern_lists pattern_registry::default_patterns()
{
    return {
        // Prototype pollution, framework internals, operators and markup
        .dangerous_keys =
            {
                R"(__proto__)",
                R"(constructor)",
                R"(prototype)",
                R"(\$\$)",
                R"(^\$)",
                R"(^_)",
                R"(<script)",
                R"(javascript:)",
                R"(on\w+\s*=)",
                R"(eval\s*\()",
                R"(Function\s*\()",
            },
        .script_injection =
            {
                R"(<script[^>]*>.*?</script>)",
                R"(javascript:\s*)",
                R"(on\w+\s*=\s*["'])",
                R"(eval\s*\()",
                R"(setTimeout\s*\()",
                R"(setInterval\s*\()",
                R"(Function\s*\()",
                R"(\.innerHTML\s*=)",
                R"(\.outerHTML\s*=)",
                R"(document\.\w+)",
                R"(window\.\w+)",
            },
        .sql_injection =
            {
                R"('\s*OR\s+'?\d+'?\s*=\s*'?\d+)",
                R"(;\s*DROP\s+TABLE)",
                R"(;\s*DELETE\s+FROM)",
                R"(;\s*INSERT\s+INTO)",
                R"(;\s*UPDATE\s+\w+\s+SET)",
                R"(UNION\s+SELECT)",
                R"(--\s*$)",
                R"(/\*.*\*/)",
                R"(xp_cmdshell)",
                R"(sp_executesql)",
            },
        .path_traversal =
            {
                R"(\.\./)",
                R"(\.\.\\)",
                R"(%2e%2e[/\\])",
                R"((?:^|/)etc/passwd)",
                R"((?:^|\\)windows\\system32)",
                R"(file://)",
                R"(\\\\)",
            },
    };
}

std::shared_ptr<const pattern_registry> pattern_registry::default_registry()
{
    static const std::shared_ptr<const pattern_registry> registry =
        std::make_shared<const pattern_registry>();
    return registry;
}

} // namespace jsentry
