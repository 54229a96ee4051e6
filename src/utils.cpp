// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>

#include "utils.hpp"

namespace jsentry {

bool string_iequals(std::string_view left, std::string_view right)
{
    return left.size() == right.size() &&
           std::equal(left.begin(), left.end(), right.begin(),
               [](char l, char r) { return tolower(l) == tolower(r); });
}

std::optional<uint64_t> to_unsigned(double value)
{
    if (!std::isfinite(value) || value < 0 || value > max_exact_integer ||
        std::trunc(value) != value) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

} // namespace jsentry
