// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace jsentry {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isxdigit(char c) { return isdigit(c) || ((unsigned)c | 32) - 'a' < 6; }
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

template <class Fn> class defer {
public:
    explicit defer(Fn &&fn) noexcept : fn_(std::move(fn)) {}
    ~defer() { fn_(); }

    defer(const defer &) = delete;
    defer(defer &&) = delete;
    defer &operator=(const defer &) = delete;
    defer &operator=(defer &&) = delete;

protected:
    Fn fn_;
};

bool string_iequals(std::string_view left, std::string_view right);

// Largest integer a double represents exactly, along with all smaller ones
inline constexpr double max_exact_integer = 9007199254740992.0; // 2^53

// Converts a double holding a non-negative integral value within the exact
// range, returns nullopt otherwise
std::optional<uint64_t> to_unsigned(double value);

} // namespace jsentry
