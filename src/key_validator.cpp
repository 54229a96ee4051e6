// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <vector>

#include "key_validator.hpp"
#include "log.hpp"
#include "pattern_registry.hpp"
#include "utf8.hpp"
#include "violation.hpp"

namespace jsentry {

void key_validator::validate(
    std::string_view key, const std::string &path, std::vector<violation> &violations) const
{
    if (!enabled() || !registry_.match(key, pattern_category::dangerous_key)) {
        return;
    }

    violations.emplace_back(violation::make(violation_kind::dangerous_key,
        fmt::format("Dangerous key pattern detected: {}",
            utf8::prefix(key, violation::max_snippet_length)),
        path, key));
}

} // namespace jsentry
