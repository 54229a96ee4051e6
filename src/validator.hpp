// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "config.hpp"
#include "object.hpp"
#include "pattern_registry.hpp"
#include "security_result.hpp"
#include "violation.hpp"

namespace jsentry {

// Entry point of the engine. A validator only holds the pattern registry,
// limits and modes are supplied on each call, so a single instance can be
// shared between threads and configurations.
class validator {
public:
    explicit validator(
        std::shared_ptr<const pattern_registry> registry = pattern_registry::default_registry())
        : registry_(std::move(registry))
    {}

    // Never throws, every problem found is reported as a violation
    [[nodiscard]] validation_result validate(
        const object &root, const validation_config &config = {}) const;

    // Text larger than max_total_size_bytes is rejected without being parsed,
    // malformed JSON is reported as invalid_unicode at the root.
    [[nodiscard]] validation_result validate_text(
        std::string_view text, const validation_config &config = {}) const;

    [[nodiscard]] object sanitize(const object &root, const validation_config &config = {},
        bool remove_dangerous = true) const;

    [[nodiscard]] static std::string hash(const object &root);
    [[nodiscard]] static bool verify(const object &root, std::string_view expected_hash);

    // Canonical text of root, sanitised beforehand unless requested otherwise.
    // In strict mode any violation, including a canonical text larger than
    // max_total_size_bytes, fails the operation.
    [[nodiscard]] security_result<std::string> serialize(const object &root,
        const validation_config &config = {}, bool sanitize_first = true) const;

    // Parses and validates text. Oversized or malformed text always fails,
    // other violations only fail the operation in strict mode.
    [[nodiscard]] security_result<object> deserialize(std::string_view text,
        const validation_config &config = {}, bool sanitize_after = false) const;

    [[nodiscard]] const pattern_registry &registry() const { return *registry_; }

protected:
    std::shared_ptr<const pattern_registry> registry_;
};

} // namespace jsentry
