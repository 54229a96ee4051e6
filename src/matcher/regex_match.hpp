// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>
#include <utility>

namespace jsentry::matcher {

class regex_match {
public:
    static constexpr std::string_view matcher_name = "match_regex";

    // Throws parsing_error if the expression can't be compiled
    regex_match(std::string_view regex_str, bool case_sensitive, bool dot_matches_newline = false);
    ~regex_match() = default;
    regex_match(const regex_match &) = delete;
    regex_match(regex_match &&) noexcept = default;
    regex_match &operator=(const regex_match &) = delete;
    regex_match &operator=(regex_match &&) noexcept = default;

    [[nodiscard]] std::string_view name() const { return matcher_name; }
    [[nodiscard]] std::string_view to_string() const { return regex->pattern(); }

    // Unanchored search, returns the matched fragment as highlight
    [[nodiscard]] std::pair<bool, std::string> match(std::string_view input) const;
    // Same search without extracting the highlight
    [[nodiscard]] bool search(std::string_view input) const;

protected:
    std::unique_ptr<re2::RE2> regex{nullptr};
};

} // namespace jsentry::matcher
