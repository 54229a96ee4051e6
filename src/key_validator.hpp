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

// Reports map keys matching a dangerous-key pattern. Only active in strict
// mode and while dangerous keys are disallowed.
class key_validator {
public:
    key_validator(const pattern_registry &registry, const validation_config &config)
        : registry_(registry), config_(config)
    {}

    [[nodiscard]] bool enabled() const
    {
        return !config_.allow_dangerous_keys && config_.strict_mode;
    }

    void validate(
        std::string_view key, const std::string &path, std::vector<violation> &violations) const;

protected:
    // NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
    const pattern_registry &registry_;
    const validation_config &config_;
    // NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace jsentry
