// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "log.hpp"
#include "pattern_registry.hpp"
#include "string_validator.hpp"
#include "utf8.hpp"
#include "violation.hpp"

namespace jsentry {

namespace {

std::string_view injection_message(pattern_category category)
{
    switch (category) {
    case pattern_category::script_injection:
        return "Script injection pattern detected";
    case pattern_category::sql_injection:
        return "SQL injection pattern detected";
    case pattern_category::path_traversal:
        return "Path traversal pattern detected";
    case pattern_category::dangerous_key:
        break;
    }
    return "Injection pattern detected";
}

} // namespace

void string_validator::validate(
    std::string_view value, const std::string &path, std::vector<violation> &violations) const
{
    const std::size_t length = utf8::length(value);
    if (length > config_.max_string_length) {
        violations.emplace_back(violation::make(violation_kind::size_limit_exceeded,
            fmt::format("String length {} exceeds limit of {}", length, config_.max_string_length),
            path));
        return;
    }

    if (!config_.strict_mode) {
        return;
    }

    auto match = registry_.match_any(value);
    if (match.has_value()) {
        JSENTRY_TRACE("String at {} matched {} pattern {}", path, to_string(match->category),
            registry_.patterns(match->category)[match->index].to_string());

        violations.emplace_back(violation::make(to_violation_kind(match->category),
            std::string{injection_message(match->category)}, path, value));
    }

    if (!utf8::is_valid(value)) {
        violations.emplace_back(violation::make(
            violation_kind::invalid_unicode, "Invalid Unicode characters detected", path));
    }

    if (value.find('\0') != std::string_view::npos) {
        violations.emplace_back(violation::make(
            violation_kind::binary_data, "Null bytes detected in string", path));
    }
}

} // namespace jsentry
