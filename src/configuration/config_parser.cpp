// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "config.hpp"
#include "configuration/config_parser.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "object.hpp"
#include "utils.hpp"

namespace jsentry {

namespace {

template <typename T> T parse_limit(std::string_view key, const object &value)
{
    if (!value.is_number()) {
        throw parsing_error("invalid type for '" + std::string{key} + "', expected " +
                            "a non-negative integer but found " +
                            std::string{object_type_to_str(value.type())});
    }

    auto converted = to_unsigned(value.as<double>());
    if (!converted.has_value() || *converted > std::numeric_limits<T>::max()) {
        throw parsing_error(
            "invalid value for '" + std::string{key} + "', expected a non-negative integer");
    }

    return static_cast<T>(*converted);
}

bool parse_flag(std::string_view key, const object &value)
{
    if (!value.is_boolean()) {
        throw parsing_error("invalid type for '" + std::string{key} +
                            "', expected boolean but found " +
                            std::string{object_type_to_str(value.type())});
    }
    return value.as<bool>();
}

} // namespace

validation_config parse_config(const object &root)
{
    if (!root.is_map()) {
        throw parsing_error("configuration must be a map");
    }

    validation_config config;
    if (const auto *preset_value = root.find("preset"); preset_value != nullptr) {
        if (!preset_value->is_string()) {
            throw parsing_error("invalid type for 'preset', expected string");
        }

        auto name = preset_value->as<std::string_view>();
        auto base = preset_from_string(name);
        if (!base.has_value()) {
            throw parsing_error("unknown preset '" + std::string{name} + "'");
        }
        config = config_from_preset(*base);
        JSENTRY_DEBUG("Using configuration preset {}", name);
    }

    for (const auto &[key, value] : root.as_map()) {
        if (key == "preset") {
            continue;
        }

        if (key == "max_depth") {
            config.max_depth = parse_limit<uint32_t>(key, value);
        } else if (key == "max_total_size_bytes") {
            config.max_total_size_bytes = parse_limit<uint64_t>(key, value);
        } else if (key == "max_string_length") {
            config.max_string_length = parse_limit<uint32_t>(key, value);
        } else if (key == "max_array_length") {
            config.max_array_length = parse_limit<uint32_t>(key, value);
        } else if (key == "max_keys") {
            config.max_keys = parse_limit<uint32_t>(key, value);
        } else if (key == "allow_dangerous_keys") {
            config.allow_dangerous_keys = parse_flag(key, value);
        } else if (key == "strict_mode") {
            config.strict_mode = parse_flag(key, value);
        } else {
            throw parsing_error("unknown configuration field '" + key + "'");
        }
    }

    return config;
}

} // namespace jsentry
