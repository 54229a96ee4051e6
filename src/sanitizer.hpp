// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

#include "config.hpp"
#include "object.hpp"
#include "pattern_registry.hpp"

namespace jsentry {

// Produces a cleaned copy of an object tree, the input is never modified.
// Applying the sanitizer to its own output yields the same tree.
class sanitizer {
public:
    sanitizer(const pattern_registry &registry, const validation_config &config,
        bool remove_dangerous = true)
        : registry_(registry), config_(config), remove_dangerous_(remove_dangerous)
    {}

    [[nodiscard]] object sanitize(const object &root) const;

    // HTML-escapes, strips NUL bytes and truncates to max_string_length
    [[nodiscard]] std::string sanitize_string(std::string_view value) const;

    static constexpr std::string_view truncation_marker{"..."};

protected:
    object sanitize_node(const object &node, std::unordered_set<const void *> &open) const;
    object sanitize_map(const object &node, std::unordered_set<const void *> &open) const;
    object sanitize_array(const object &node, std::unordered_set<const void *> &open) const;

    [[nodiscard]] std::string truncate(std::string value) const;

    // NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
    const pattern_registry &registry_;
    const validation_config &config_;
    // NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool remove_dangerous_;
};

} // namespace jsentry
