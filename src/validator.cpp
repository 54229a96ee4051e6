// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hpp"
#include "integrity.hpp"
#include "json_utils.hpp"
#include "log.hpp"
#include "object.hpp"
#include "sanitizer.hpp"
#include "security_result.hpp"
#include "tree_walker.hpp"
#include "validator.hpp"
#include "violation.hpp"

namespace jsentry {

namespace {

void log_violations(const std::vector<violation> &violations)
{
    for (const auto &v : violations) {
        JSENTRY_TRACE("{} ({}) at {}: {}", to_string(v.kind), to_string(v.level), v.path,
            v.message);
    }
}

} // namespace

validation_result validator::validate(const object &root, const validation_config &config) const
{
    const tree_walker walker{*registry_, config};
    validation_result result{walker.walk(root)};
    log_violations(result.violations);
    return result;
}

validation_result validator::validate_text(
    std::string_view text, const validation_config &config) const
{
    if (auto oversize = tree_walker::check_total_size(text, config); oversize.has_value()) {
        return {{std::move(*oversize)}};
    }

    auto parsed = json_to_object(text, config.max_depth);
    if (!parsed.ok()) {
        return {{parse_violation(parsed)}};
    }

    return validate(parsed.value, config);
}

object validator::sanitize(
    const object &root, const validation_config &config, bool remove_dangerous) const
{
    const sanitizer cleaner{*registry_, config, remove_dangerous};
    return cleaner.sanitize(root);
}

std::string validator::hash(const object &root) { return integrity::hash(root); }

bool validator::verify(const object &root, std::string_view expected_hash)
{
    return integrity::verify(root, expected_hash);
}

security_result<std::string> validator::serialize(
    const object &root, const validation_config &config, bool sanitize_first) const
{
    const object data = sanitize_first ? sanitize(root, config) : root;

    auto result = validate(data, config);
    auto text = object_to_json(data, true);
    if (auto oversize = tree_walker::check_total_size(text, config); oversize.has_value()) {
        result.violations.emplace_back(std::move(*oversize));
    }

    if (config.strict_mode && !result.is_valid()) {
        JSENTRY_DEBUG("Serialization rejected with {} violations", result.violations.size());
        return security_error{std::move(result.violations)};
    }

    return {std::move(text), std::move(result.violations)};
}

security_result<object> validator::deserialize(
    std::string_view text, const validation_config &config, bool sanitize_after) const
{
    if (auto oversize = tree_walker::check_total_size(text, config); oversize.has_value()) {
        JSENTRY_DEBUG("Rejected JSON of {} bytes, limit is {}", text.size(),
            config.max_total_size_bytes);
        auto message = oversize->message;
        return security_error{std::move(message), {std::move(*oversize)}};
    }

    // The returned tree must be complete, so the depth limit is enforced by
    // the walker rather than by clipping the parse
    auto parsed = json_to_document(text);
    if (!parsed.ok()) {
        auto error = parse_violation(parsed);
        auto message = error.message;
        return security_error{std::move(message), {std::move(error)}};
    }

    auto result = validate(parsed.value, config);
    if (config.strict_mode && !result.is_valid()) {
        JSENTRY_DEBUG("Deserialization rejected with {} violations", result.violations.size());
        return security_error{std::move(result.violations)};
    }

    if (sanitize_after && !config.strict_mode) {
        return {sanitize(parsed.value, config), std::move(result.violations)};
    }

    return {std::move(parsed.value), std::move(result.violations)};
}

} // namespace jsentry
