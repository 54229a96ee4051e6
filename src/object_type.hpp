// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

namespace jsentry {

enum class object_type : uint8_t {
    // Null value
    null = 0x01, // 0b00000001
    // Scalars
    boolean = 0x02,  // 0b00000010
    float64 = 0x08,  // 0b00001000
    string = 0x10,   // 0b00010000
    scalar = 0x1A,   // 0b00011010
    // Containers
    array = 0x20,    // 0b00100000
    map = 0x40,      // 0b01000000
    container = 0x60 // 0b01100000
};

template <typename T>
constexpr object_type operator&(object_type left, T right)
    requires std::is_same_v<T, object_type> || std::is_integral_v<T>
{
    using utype = std::underlying_type_t<object_type>;
    return static_cast<object_type>(static_cast<utype>(left) & static_cast<utype>(right));
}

constexpr bool is_container(object_type type)
{
    return (type & object_type::container) != static_cast<object_type>(0);
}

constexpr bool is_scalar(object_type type)
{
    return (type & object_type::scalar) != static_cast<object_type>(0);
}

inline std::string_view object_type_to_str(object_type type)
{
    switch (type) {
    case object_type::null:
        return "null";
    case object_type::boolean:
        return "boolean";
    case object_type::float64:
        return "float64";
    case object_type::string:
        return "string";
    case object_type::array:
        return "array";
    case object_type::map:
        return "map";
    case object_type::scalar:
    case object_type::container:
        break;
    }
    return "unknown";
}

} // namespace jsentry
