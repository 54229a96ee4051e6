// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <optional>
#include <string_view>

#include "config.hpp"

namespace jsentry {

std::optional<preset> preset_from_string(std::string_view str)
{
    if (str == "strict") {
        return preset::strict;
    }
    if (str == "relaxed") {
        return preset::relaxed;
    }
    if (str == "api") {
        return preset::api;
    }
    return std::nullopt;
}

std::string_view to_string(preset value)
{
    switch (value) {
    case preset::strict:
        return "strict";
    case preset::relaxed:
        return "relaxed";
    case preset::api:
        return "api";
    }
    return "unknown";
}

} // namespace jsentry
