// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "pattern_registry.hpp"
#include "violation.hpp"

namespace jsentry {

// Checks applied to every string leaf: length, then (strict mode only) the
// first matching injection category, UTF-8 well-formedness and NUL bytes.
// Oversized strings are reported without running any pattern against them.
class string_validator {
public:
    string_validator(const pattern_registry &registry, const validation_config &config)
        : registry_(registry), config_(config)
    {}

    void validate(
        std::string_view value, const std::string &path, std::vector<violation> &violations) const;

protected:
    // NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
    const pattern_registry &registry_;
    const validation_config &config_;
    // NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace jsentry
