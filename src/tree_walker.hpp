// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "config.hpp"
#include "key_validator.hpp"
#include "object.hpp"
#include "pattern_registry.hpp"
#include "string_validator.hpp"
#include "violation.hpp"

namespace jsentry {

// Depth-first, pre-order traversal of an object tree collecting every
// violation found. The traversal is never interrupted: limits exceeded on a
// container are reported and its contents still visited, only nodes beyond
// max_depth and back-edges of cyclic graphs stop the descent.
//
// Paths start at "$", map entries append ".key" and array elements "[i]".
class tree_walker {
public:
    tree_walker(const pattern_registry &registry, const validation_config &config)
        : config_(config), keys_(registry, config), strings_(registry, config)
    {}

    [[nodiscard]] std::vector<violation> walk(const object &root) const;

    // Reports unparsed text larger than max_total_size_bytes, such text
    // must not reach the parser.
    [[nodiscard]] static std::optional<violation> check_total_size(
        std::string_view text, const validation_config &config);

protected:
    struct walk_state {
        std::string path;
        // Containers currently being visited, used to detect cycles
        std::unordered_set<const void *> open;
        std::vector<violation> violations;
    };

    void visit(const object &node, std::size_t depth, walk_state &state) const;
    void visit_map(const object &node, std::size_t depth, walk_state &state) const;
    void visit_array(const object &node, std::size_t depth, walk_state &state) const;

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    const validation_config &config_;
    key_validator keys_;
    string_validator strings_;
};

} // namespace jsentry
