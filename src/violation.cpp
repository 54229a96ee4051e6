// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "utf8.hpp"
#include "violation.hpp"

namespace jsentry {

std::string_view to_string(violation_kind kind)
{
    switch (kind) {
    case violation_kind::size_limit_exceeded:
        return "size_limit_exceeded";
    case violation_kind::depth_limit_exceeded:
        return "depth_limit_exceeded";
    case violation_kind::dangerous_key:
        return "dangerous_key";
    case violation_kind::script_injection:
        return "script_injection";
    case violation_kind::sql_injection:
        return "sql_injection";
    case violation_kind::path_traversal:
        return "path_traversal";
    case violation_kind::circular_reference:
        return "circular_reference";
    case violation_kind::invalid_unicode:
        return "invalid_unicode";
    case violation_kind::binary_data:
        return "binary_data";
    }
    return "unknown";
}

std::string_view to_string(severity level)
{
    switch (level) {
    case severity::low:
        return "low";
    case severity::medium:
        return "medium";
    case severity::high:
        return "high";
    case severity::critical:
        return "critical";
    }
    return "unknown";
}

violation violation::make(violation_kind kind, std::string message, std::string path)
{
    return {kind, std::move(message), std::move(path), std::nullopt, severity_of(kind)};
}

violation violation::make(
    violation_kind kind, std::string message, std::string path, std::string_view offending)
{
    return {kind, std::move(message), std::move(path),
        std::string{utf8::prefix(offending, max_snippet_length)}, severity_of(kind)};
}

std::size_t validation_result::count(violation_kind kind) const
{
    return static_cast<std::size_t>(std::count_if(violations.begin(), violations.end(),
        [kind](const violation &v) { return v.kind == kind; }));
}

} // namespace jsentry
