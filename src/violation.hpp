// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsentry {

enum class violation_kind : uint8_t {
    size_limit_exceeded,
    depth_limit_exceeded,
    dangerous_key,
    script_injection,
    sql_injection,
    path_traversal,
    circular_reference,
    invalid_unicode,
    binary_data,
};

enum class severity : uint8_t { low, medium, high, critical };

// Severity is a property of the kind, never chosen by the reporter
constexpr severity severity_of(violation_kind kind)
{
    switch (kind) {
    case violation_kind::size_limit_exceeded:
        return severity::medium;
    case violation_kind::depth_limit_exceeded:
    case violation_kind::invalid_unicode:
    case violation_kind::binary_data:
        return severity::high;
    case violation_kind::dangerous_key:
    case violation_kind::script_injection:
    case violation_kind::sql_injection:
    case violation_kind::path_traversal:
    case violation_kind::circular_reference:
        return severity::critical;
    }
    return severity::critical;
}

std::string_view to_string(violation_kind kind);
std::string_view to_string(severity level);

struct violation {
    // Maximum number of codepoints of the offending string kept in a snippet
    static constexpr std::size_t max_snippet_length = 100;

    violation_kind kind;
    std::string message;
    std::string path;
    std::optional<std::string> snippet;
    severity level{severity_of(kind)};

    static violation make(violation_kind kind, std::string message, std::string path);
    // The snippet is cut to max_snippet_length codepoints
    static violation make(
        violation_kind kind, std::string message, std::string path, std::string_view offending);

    bool operator==(const violation &) const = default;
};

struct validation_result {
    std::vector<violation> violations;

    [[nodiscard]] bool is_valid() const { return violations.empty(); }
    [[nodiscard]] std::size_t count(violation_kind kind) const;
};

} // namespace jsentry
