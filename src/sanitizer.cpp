// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "log.hpp"
#include "object.hpp"
#include "object_type.hpp"
#include "pattern_registry.hpp"
#include "sanitizer.hpp"
#include "utf8.hpp"
#include "utils.hpp"
#include "violation.hpp"

namespace jsentry {

namespace {

constexpr std::array<std::string_view, 5> html_entities{
    "&amp;", "&lt;", "&gt;", "&quot;", "&#x27;"};

// Length of the entity starting at position, zero if there is none
std::size_t entity_length_at(std::string_view str, std::size_t position)
{
    auto remaining = str.substr(position);
    for (auto entity : html_entities) {
        if (remaining.starts_with(entity)) {
            return entity.size();
        }
    }
    return 0;
}

std::string html_escape(std::string_view value)
{
    std::string output;
    output.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        switch (c) {
        case '\0':
            break;
        case '&': {
            // An existing entity is kept as is so that escaping twice is a no-op
            auto length = entity_length_at(value, i);
            if (length > 0) {
                output.append(value.substr(i, length));
                i += length - 1;
            } else {
                output.append("&amp;");
            }
            break;
        }
        case '<':
            output.append("&lt;");
            break;
        case '>':
            output.append("&gt;");
            break;
        case '"':
            output.append("&quot;");
            break;
        case '\'':
            output.append("&#x27;");
            break;
        default:
            output.push_back(c);
            break;
        }
    }

    return output;
}

} // namespace

object sanitizer::sanitize(const object &root) const
{
    std::unordered_set<const void *> open;
    return sanitize_node(root, open);
}

std::string sanitizer::sanitize_string(std::string_view value) const
{
    return truncate(html_escape(value));
}

std::string sanitizer::truncate(std::string value) const
{
    if (utf8::length(value) <= config_.max_string_length) {
        return value;
    }

    if (config_.max_string_length < truncation_marker.size()) {
        return std::string{truncation_marker};
    }

    auto cut = utf8::prefix(value, config_.max_string_length - truncation_marker.size()).size();

    // Every ampersand in an escaped string starts an entity, cutting through
    // one would leave a dangling ampersand behind.
    static constexpr std::size_t max_entity_length = 6;
    for (std::size_t back = 1; back < max_entity_length && back <= cut; ++back) {
        if (value[cut - back] == '&') {
            if (entity_length_at(value, cut - back) > back) {
                cut -= back;
            }
            break;
        }
    }

    value.resize(cut);
    value.append(truncation_marker);
    return value;
}

// NOLINTNEXTLINE(misc-no-recursion)
object sanitizer::sanitize_node(const object &node, std::unordered_set<const void *> &open) const
{
    switch (node.type()) {
    case object_type::map:
    case object_type::array: {
        const auto *id = node.container_id();
        if (open.contains(id)) {
            JSENTRY_DEBUG("Replacing circular reference with null");
            return object::make_null();
        }

        open.emplace(id);
        const defer close{[&open, id]() { open.erase(id); }};

        return node.is_map() ? sanitize_map(node, open) : sanitize_array(node, open);
    }
    case object_type::string:
        return object::make_string(sanitize_string(node.as<std::string_view>()));
    case object_type::null:
    case object_type::boolean:
    case object_type::float64:
    case object_type::scalar:
    case object_type::container:
        break;
    }
    return node;
}

// NOLINTNEXTLINE(misc-no-recursion)
object sanitizer::sanitize_map(const object &node, std::unordered_set<const void *> &open) const
{
    const auto &map = node.as_map();
    auto output = object::make_map(map.size());

    for (const auto &[key, value] : map) {
        std::string output_key = key;
        if (!config_.allow_dangerous_keys &&
            registry_.match(key, pattern_category::dangerous_key)) {
            if (remove_dangerous_) {
                JSENTRY_DEBUG("Removing dangerous key {}",
                    utf8::prefix(key, violation::max_snippet_length));
                continue;
            }
            output_key = sanitize_string(key);
        }

        // A sanitized key may collide with an existing one, the entry then
        // keeps its first position and takes the latest value.
        output.emplace(std::move(output_key), sanitize_node(value, open));
    }

    return output;
}

// NOLINTNEXTLINE(misc-no-recursion)
object sanitizer::sanitize_array(const object &node, std::unordered_set<const void *> &open) const
{
    const auto &array = node.as_array();
    auto output = object::make_array(array.size());
    for (const auto &value : array) { output.emplace_back(sanitize_node(value, open)); }
    return output;
}

} // namespace jsentry
