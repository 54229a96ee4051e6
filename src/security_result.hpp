// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <exception>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "violation.hpp"

namespace jsentry {

// Carries every violation that led to a payload being rejected
class security_error : public std::exception {
public:
    explicit security_error(std::vector<violation> violations)
        : what_("security violations detected: " + std::to_string(violations.size()) + " issues"),
          violations_(std::move(violations))
    {}
    security_error(std::string what, std::vector<violation> violations)
        : what_(std::move(what)), violations_(std::move(violations))
    {}

    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }
    [[nodiscard]] const std::vector<violation> &violations() const noexcept { return violations_; }

protected:
    std::string what_;
    std::vector<violation> violations_;
};

// Outcome of a composite operation, either the produced value or the error
// explaining why the payload was rejected. A value accepted despite
// violations, outside of strict mode, carries them as warnings.
template <typename T> class security_result {
public:
    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    security_result(T value) : value_(std::move(value)) {}
    security_result(T value, std::vector<violation> warnings)
        : value_(std::move(value)), warnings_(std::move(warnings))
    {}
    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    security_result(security_error error) : value_(std::move(error)) {}

    [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(value_); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }

    // Throws the contained security_error if there is no value
    [[nodiscard]] const T &value() const &
    {
        if (const auto *error = std::get_if<security_error>(&value_)) {
            throw *error;
        }
        return std::get<T>(value_);
    }

    [[nodiscard]] T &&value() &&
    {
        if (const auto *error = std::get_if<security_error>(&value_)) {
            throw *error;
        }
        return std::get<T>(std::move(value_));
    }

    [[nodiscard]] const T &operator*() const & { return std::get<T>(value_); }
    [[nodiscard]] const T *operator->() const { return &std::get<T>(value_); }

    [[nodiscard]] const security_error &error() const { return std::get<security_error>(value_); }

    // Always empty on error, the violations are part of the error instead
    [[nodiscard]] const std::vector<violation> &warnings() const { return warnings_; }

protected:
    std::variant<T, security_error> value_;
    std::vector<violation> warnings_;
};

} // namespace jsentry
