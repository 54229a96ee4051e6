// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace jsentry::utf8 {

inline constexpr uint32_t max_codepoint = 0x10FFFF;
inline constexpr uint32_t invalid = 0xFFFFFFFF;
inline constexpr uint32_t eof = 0xFFFFFFFE;

// Decodes the codepoint at position and advances it past the sequence. On a
// malformed sequence, position advances by a single byte and invalid is
// returned. Overlong encodings, surrogates and codepoints above
// max_codepoint are malformed.
uint32_t fetch_next_codepoint(std::string_view str, std::size_t &position);

bool is_valid(std::string_view str);

// Number of codepoints, each byte of a malformed sequence counts as one
std::size_t length(std::string_view str);

// First max_codepoints codepoints of str, never splitting a sequence
std::string_view prefix(std::string_view str, std::size_t max_codepoints);

} // namespace jsentry::utf8
