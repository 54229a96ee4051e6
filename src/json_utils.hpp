// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "config.hpp"
#include "object.hpp"
#include "violation.hpp"

namespace jsentry {

struct json_parse_result {
    object value;
    // Empty on success
    std::string error;
    std::size_t offset{0};
    // Content nested deeper than the limit was skipped
    bool clipped{false};

    [[nodiscard]] bool ok() const { return error.empty(); }
};

// Parses json into an object tree. Containers nested deeper than
// max_depth + 1 levels below the root are kept empty, their contents are
// skipped without being materialised.
json_parse_result json_to_object(
    std::string_view json, std::size_t max_depth = validation_config::default_max_depth);

// Deepest value accepted by json_to_document, the root being at depth 0
inline constexpr std::size_t max_document_depth = 512;

// Parses json keeping every level. A document with a value nested deeper
// than max_document_depth is not clipped but fails with clipped set.
json_parse_result json_to_document(std::string_view json);

// Violation at "$" describing why a document could not be parsed
violation parse_violation(const json_parse_result &parsed);

// Serialises an object tree without whitespace. In canonical mode map keys
// are sorted bytewise at every level, otherwise insertion order is kept.
// Integral numbers below 2^53 are written without a fraction and containers
// reached through a cycle are written as null.
std::string object_to_json(const object &root, bool canonical = false);

// Report document of a validation:
// {"valid":bool,"violations":[{"kind","severity","path","message","snippet"}]}
std::string result_to_json(const validation_result &result);

} // namespace jsentry
