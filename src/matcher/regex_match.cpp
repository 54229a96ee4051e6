// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>
#include <utility>

#include "exception.hpp"
#include "matcher/regex_match.hpp"

namespace jsentry::matcher {

regex_match::regex_match(std::string_view regex_str, bool case_sensitive, bool dot_matches_newline)
{
    constexpr unsigned regex_max_mem = 512 * 1024;

    re2::RE2::Options options;
    options.set_max_mem(regex_max_mem);
    options.set_log_errors(false);
    options.set_case_sensitive(case_sensitive);
    options.set_dot_nl(dot_matches_newline);

    regex = std::make_unique<re2::RE2>(re2::StringPiece(regex_str.data(), regex_str.size()), options);

    if (!regex->ok()) {
        throw parsing_error("invalid regular expression: " + regex->error_arg());
    }
}

std::pair<bool, std::string> regex_match::match(std::string_view input) const
{
    if (input.empty()) {
        return {false, {}};
    }

    re2::StringPiece match;
    const re2::StringPiece ref(input.data(), input.size());
    if (!regex->Match(ref, 0, input.size(), re2::RE2::UNANCHORED, &match, 1)) {
        return {false, {}};
    }

    return {true, std::string{match.data(), match.size()}};
}

bool regex_match::search(std::string_view input) const
{
    if (input.empty()) {
        return false;
    }

    const re2::StringPiece ref(input.data(), input.size());
    return regex->Match(ref, 0, input.size(), re2::RE2::UNANCHORED, nullptr, 0);
}

} // namespace jsentry::matcher
