// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "config.hpp"
#include "jsentry.h"
#include "json_utils.hpp"
#include "log.hpp"
#include "object.hpp"
#include "tree_walker.hpp"
#include "validator.hpp"
#include "violation.hpp"

using namespace jsentry;

static_assert(static_cast<int>(log_level::trace) == JSENTRY_LOG_TRACE);
static_assert(static_cast<int>(log_level::debug) == JSENTRY_LOG_DEBUG);
static_assert(static_cast<int>(log_level::info) == JSENTRY_LOG_INFO);
static_assert(static_cast<int>(log_level::warn) == JSENTRY_LOG_WARN);
static_assert(static_cast<int>(log_level::error) == JSENTRY_LOG_ERROR);
static_assert(static_cast<int>(log_level::off) == JSENTRY_LOG_OFF);

namespace {

jsentry_log_cb binding_log_cb = nullptr;

void relay_log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t message_len)
{
    if (binding_log_cb != nullptr) {
        binding_log_cb(
            static_cast<JSENTRY_LOG_LEVEL>(level), function, file, line, message, message_len);
    }
}

validation_config config_from_binding(const jsentry_config *config)
{
    if (config == nullptr) {
        return {};
    }

    validation_config output;
    if (config->max_depth > 0) {
        output.max_depth = config->max_depth;
    }
    if (config->max_total_size_bytes > 0) {
        output.max_total_size_bytes = config->max_total_size_bytes;
    }
    if (config->max_string_length > 0) {
        output.max_string_length = config->max_string_length;
    }
    if (config->max_array_length > 0) {
        output.max_array_length = config->max_array_length;
    }
    if (config->max_keys > 0) {
        output.max_keys = config->max_keys;
    }
    output.allow_dangerous_keys = config->allow_dangerous_keys;
    output.strict_mode = config->strict_mode;
    return output;
}

jsentry_config config_to_binding(const validation_config &config)
{
    return {config.max_depth, config.max_total_size_bytes, config.max_string_length,
        config.max_array_length, config.max_keys, config.allow_dangerous_keys,
        config.strict_mode};
}

// The output is allocated with malloc so that bindings may release it
// without going through the library.
bool set_output(jsentry_result *result, std::string_view output)
{
    // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
    auto *buffer = static_cast<char *>(malloc(output.size() + 1));
    if (buffer == nullptr) {
        return false;
    }

    memcpy(buffer, output.data(), output.size());
    buffer[output.size()] = '\0';

    result->output = buffer;
    result->output_length = output.size();
    return true;
}

JSENTRY_RET_CODE report(const validation_result &validation, jsentry_result *result)
{
    result->violation_count = validation.violations.size();
    if (!set_output(result, result_to_json(validation))) {
        return JSENTRY_ERR_INTERNAL;
    }
    return validation.is_valid() ? JSENTRY_OK : JSENTRY_VIOLATION;
}

const validator &default_validator()
{
    static const validator instance;
    return instance;
}

} // namespace

extern "C" {

const char *jsentry_get_version() { return JSENTRY_VERSION; }

bool jsentry_set_log_cb(jsentry_log_cb cb, JSENTRY_LOG_LEVEL min_level)
{
    binding_log_cb = cb;
    if (cb == nullptr) {
        logger::init(nullptr, log_level::off);
        return true;
    }

    auto level = static_cast<log_level>(min_level);
    logger::init(relay_log, level);
    JSENTRY_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}

jsentry_config jsentry_config_preset(JSENTRY_PRESET preset)
{
    switch (preset) {
    case JSENTRY_PRESET_STRICT:
        return config_to_binding(strict_preset());
    case JSENTRY_PRESET_RELAXED:
        return config_to_binding(relaxed_preset());
    case JSENTRY_PRESET_API:
        return config_to_binding(api_preset());
    }
    return config_to_binding({});
}

JSENTRY_RET_CODE jsentry_validate(
    const char *json, size_t length, const jsentry_config *config, jsentry_result *result)
{
    if (json == nullptr || result == nullptr) {
        JSENTRY_WARN("Tried to validate a null document or without a result");
        return JSENTRY_ERR_INVALID_ARGUMENT;
    }
    *result = {0, nullptr, 0};

    try {
        const auto &engine = default_validator();
        return report(engine.validate_text({json, length}, config_from_binding(config)), result);
    } catch (const std::exception &e) {
        JSENTRY_ERROR("{}", e.what());
    }
    return JSENTRY_ERR_INTERNAL;
}

JSENTRY_RET_CODE jsentry_sanitize(const char *json, size_t length, const jsentry_config *config,
    bool remove_dangerous, jsentry_result *result)
{
    if (json == nullptr || result == nullptr) {
        JSENTRY_WARN("Tried to sanitize a null document or without a result");
        return JSENTRY_ERR_INVALID_ARGUMENT;
    }
    *result = {0, nullptr, 0};

    try {
        const auto &engine = default_validator();
        auto cfg = config_from_binding(config);

        const std::string_view text{json, length};
        if (auto oversize = tree_walker::check_total_size(text, cfg); oversize.has_value()) {
            return report({{std::move(*oversize)}}, result);
        }

        auto parsed = json_to_document(text);
        if (!parsed.ok()) {
            return report({{parse_violation(parsed)}}, result);
        }

        auto sanitized = engine.sanitize(parsed.value, cfg, remove_dangerous);
        if (!set_output(result, object_to_json(sanitized))) {
            return JSENTRY_ERR_INTERNAL;
        }
        return JSENTRY_OK;
    } catch (const std::exception &e) {
        JSENTRY_ERROR("{}", e.what());
    }
    return JSENTRY_ERR_INTERNAL;
}

JSENTRY_RET_CODE jsentry_hash(const char *json, size_t length, jsentry_result *result)
{
    if (json == nullptr || result == nullptr) {
        JSENTRY_WARN("Tried to hash a null document or without a result");
        return JSENTRY_ERR_INVALID_ARGUMENT;
    }
    *result = {0, nullptr, 0};

    try {
        auto parsed = json_to_document({json, length});
        if (!parsed.ok()) {
            JSENTRY_DEBUG("Unable to hash document: {}", parsed.error);
            return JSENTRY_ERR_INVALID_ARGUMENT;
        }

        if (!set_output(result, validator::hash(parsed.value))) {
            return JSENTRY_ERR_INTERNAL;
        }
        return JSENTRY_OK;
    } catch (const std::exception &e) {
        JSENTRY_ERROR("{}", e.what());
    }
    return JSENTRY_ERR_INTERNAL;
}

void jsentry_result_free(jsentry_result *result)
{
    if (result == nullptr) {
        return;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
    free(result->output);
    *result = {0, nullptr, 0};
}

} // extern "C"
