// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "utf8.hpp"

namespace jsentry::utf8 {

namespace {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
int8_t find_next_code_unit_sequence_length(std::string_view str, std::size_t position)
{
    const std::size_t length_left = str.size() - position;
    if (length_left == 0) {
        return 0;
    }

    // Valid UTF8 has a specific binary format.
    //  If it's a single byte UTF8 character, then it is always of form '0xxxxxxx', where 'x' is any
    //  binary digit. If it's a two byte UTF8 character, then it's always of form '110xxxxx
    //  10xxxxxx'. Similarly for three and four byte UTF8 characters it starts with '1110xxxx' and
    //  '11110xxx' followed by '10xxxxxx' one less times as there are bytes.
    const auto first_byte = static_cast<uint8_t>(str[position]);
    int8_t expected_length = -1;

    if ((first_byte & 0x80) == 0) {
        return 1;
    }

    if ((first_byte >> 5) == 0x6) {
        expected_length = 2;
    } else if ((first_byte >> 4) == 0xe) {
        expected_length = 3;
    } else if ((first_byte >> 3) == 0x1e) {
        expected_length = 4;
    }

    if (expected_length < 0 || static_cast<std::size_t>(expected_length) > length_left) {
        return -1;
    }

    for (int8_t i = 1; i < expected_length; ++i) {
        // Every continuation byte must be prefixed by 10xxxxxx
        if ((static_cast<uint8_t>(str[position + i]) >> 6) != 0x2) {
            return -1;
        }
    }

    return expected_length;
}

// Smallest codepoint requiring each sequence length, anything below is overlong
constexpr std::array<uint32_t, 5> min_codepoint_for_length{0, 0, 0x80, 0x800, 0x10000};

} // namespace

uint32_t fetch_next_codepoint(std::string_view str, std::size_t &position)
{
    if (position >= str.size()) {
        return eof;
    }

    const int8_t next_length = find_next_code_unit_sequence_length(str, position);
    if (next_length <= 0) {
        position += 1;
        return invalid;
    }

    if (next_length == 1) {
        return static_cast<uint8_t>(str[position++]);
    }

    // The lead byte carries 7 - next_length payload bits, each continuation
    // byte carries 6 more.
    //  NGL = 2, buf = 110xxxxx -> buf & 00011111
    //  NGL = 3, buf = 1110xxxx -> buf & 00001111
    //  NGL = 4, buf = 11110xxx -> buf & 00000111
    uint32_t codepoint = static_cast<uint8_t>(str[position]) & (0xFFU >> (next_length + 1));
    for (int8_t i = 1; i < next_length; ++i) {
        codepoint = (codepoint << 6) | (static_cast<uint8_t>(str[position + i]) & 0x3FU);
    }

    if (codepoint < min_codepoint_for_length[next_length] || codepoint > max_codepoint ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        position += 1;
        return invalid;
    }

    position += next_length;
    return codepoint;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

bool is_valid(std::string_view str)
{
    std::size_t position = 0;
    while (position < str.size()) {
        if (fetch_next_codepoint(str, position) == invalid) {
            return false;
        }
    }
    return true;
}

std::size_t length(std::string_view str)
{
    std::size_t count = 0;
    std::size_t position = 0;
    while (position < str.size()) {
        fetch_next_codepoint(str, position);
        ++count;
    }
    return count;
}

std::string_view prefix(std::string_view str, std::size_t max_codepoints)
{
    std::size_t position = 0;
    for (std::size_t count = 0; count < max_codepoints && position < str.size(); ++count) {
        fetch_next_codepoint(str, position);
    }
    return str.substr(0, position);
}

} // namespace jsentry::utf8
