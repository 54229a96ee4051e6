// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "log.hpp"
#include "object.hpp"
#include "object_type.hpp"
#include "tree_walker.hpp"
#include "utils.hpp"
#include "violation.hpp"

namespace jsentry {

std::vector<violation> tree_walker::walk(const object &root) const
{
    walk_state state;
    state.path = "$";
    visit(root, 0, state);
    return std::move(state.violations);
}

std::optional<violation> tree_walker::check_total_size(
    std::string_view text, const validation_config &config)
{
    if (text.size() <= config.max_total_size_bytes) {
        return std::nullopt;
    }

    return violation::make(violation_kind::size_limit_exceeded,
        fmt::format("Total JSON size exceeds {} bytes", config.max_total_size_bytes), "$");
}

// NOLINTNEXTLINE(misc-no-recursion)
void tree_walker::visit(const object &node, std::size_t depth, walk_state &state) const
{
    if (depth > config_.max_depth) {
        state.violations.emplace_back(violation::make(violation_kind::depth_limit_exceeded,
            fmt::format("Nesting depth exceeds {}", config_.max_depth), state.path));
        return;
    }

    switch (node.type()) {
    case object_type::map:
    case object_type::array: {
        // Only reachable with containers shared programmatically, a parsed
        // document never refers back to one of its ancestors.
        const auto *id = node.container_id();
        if (state.open.contains(id)) {
            state.violations.emplace_back(violation::make(
                violation_kind::circular_reference, "Circular reference detected", state.path));
            return;
        }

        state.open.emplace(id);
        const defer close{[&state, id]() { state.open.erase(id); }};

        if (node.is_map()) {
            visit_map(node, depth, state);
        } else {
            visit_array(node, depth, state);
        }
        break;
    }
    case object_type::string:
        strings_.validate(node.as<std::string_view>(), state.path, state.violations);
        break;
    case object_type::null:
    case object_type::boolean:
    case object_type::float64:
    case object_type::scalar:
    case object_type::container:
        break;
    }
}

// NOLINTNEXTLINE(misc-no-recursion)
void tree_walker::visit_map(const object &node, std::size_t depth, walk_state &state) const
{
    const auto &map = node.as_map();
    if (map.size() > config_.max_keys) {
        state.violations.emplace_back(violation::make(violation_kind::size_limit_exceeded,
            fmt::format("Object has {} keys, exceeds limit of {}", map.size(), config_.max_keys),
            state.path));
    }

    const std::size_t parent_length = state.path.size();
    for (const auto &[key, value] : map) {
        state.path.append(1, '.').append(key);
        const defer restore{[&state, parent_length]() { state.path.resize(parent_length); }};

        keys_.validate(key, state.path, state.violations);
        visit(value, depth + 1, state);
    }
}

// NOLINTNEXTLINE(misc-no-recursion)
void tree_walker::visit_array(const object &node, std::size_t depth, walk_state &state) const
{
    const auto &array = node.as_array();
    if (array.size() > config_.max_array_length) {
        state.violations.emplace_back(violation::make(violation_kind::size_limit_exceeded,
            fmt::format("Array has {} items, exceeds limit of {}", array.size(),
                config_.max_array_length),
            state.path));
    }

    const std::size_t parent_length = state.path.size();
    for (std::size_t i = 0; i < array.size(); ++i) {
        fmt::format_to(std::back_inserter(state.path), "[{}]", i);
        const defer restore{[&state, parent_length]() { state.path.resize(parent_length); }};

        visit(array[i], depth + 1, state);
    }
}

} // namespace jsentry
