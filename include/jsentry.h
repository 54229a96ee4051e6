// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef JSENTRY_H
#define JSENTRY_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum JSENTRY_RET_CODE
 *
 * Codes returned by jsentry_validate, jsentry_sanitize and jsentry_hash.
 **/
typedef enum
{
    JSENTRY_ERR_INTERNAL         = -2,
    JSENTRY_ERR_INVALID_ARGUMENT = -1,
    JSENTRY_OK                   = 0,
    JSENTRY_VIOLATION            = 1,
} JSENTRY_RET_CODE;

/**
 * @enum JSENTRY_LOG_LEVEL
 *
 * Internal logging levels, a callback is only invoked for messages at or
 * above the level provided to jsentry_set_log_cb.
 **/
typedef enum
{
    JSENTRY_LOG_TRACE,
    JSENTRY_LOG_DEBUG,
    JSENTRY_LOG_INFO,
    JSENTRY_LOG_WARN,
    JSENTRY_LOG_ERROR,
    JSENTRY_LOG_OFF,
} JSENTRY_LOG_LEVEL;

/**
 * @enum JSENTRY_PRESET
 *
 * Predefined configurations.
 **/
typedef enum
{
    // Default limits with a depth of 5 and payloads of up to 50000 bytes
    JSENTRY_PRESET_STRICT,
    // Content checks and dangerous keys disabled, depth of 20 and payloads
    // of up to 10000000 bytes
    JSENTRY_PRESET_RELAXED,
    // Default limits with at most 100 keys per object and 100 array items
    JSENTRY_PRESET_API,
} JSENTRY_PRESET;

typedef struct _jsentry_config jsentry_config;
typedef struct _jsentry_result jsentry_result;

/**
 * @struct jsentry_config
 *
 * Limits and modes applied to a call. A limit set to zero takes its default
 * value, flags are used as provided.
 **/
struct _jsentry_config
{
    /** Maximum nesting depth, the root being at depth 0 */
    uint32_t max_depth;
    /** Maximum size in bytes of the JSON text */
    uint64_t max_total_size_bytes;
    /** Maximum length of a string in codepoints */
    uint32_t max_string_length;
    /** Maximum number of items in an array */
    uint32_t max_array_length;
    /** Maximum number of keys in an object */
    uint32_t max_keys;
    /** Whether keys such as __proto__ are accepted */
    bool allow_dangerous_keys;
    /** Whether string contents and keys are inspected */
    bool strict_mode;
};

/**
 * @struct jsentry_result
 *
 * Output of a call, must be released with jsentry_result_free.
 **/
struct _jsentry_result
{
    /** Number of violations found */
    uint64_t violation_count;
    /** NUL-terminated output, its contents depend on the call (nullable) */
    char *output;
    /** Length of the output, excluding the NUL terminator */
    uint64_t output_length;
};

/**
 * @typedef jsentry_log_cb
 *
 * Callback used to relay log messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emitted the message. (nonnull)
 * @param line The line where the message was emitted.
 * @param message The logging message, NUL-terminated. (nonnull)
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*jsentry_log_cb)(
    JSENTRY_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * jsentry_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *jsentry_get_version();

/**
 * jsentry_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool jsentry_set_log_cb(jsentry_log_cb cb, JSENTRY_LOG_LEVEL min_level);

/**
 * jsentry_config_preset
 *
 * Returns the configuration of a preset, or the default configuration if
 * the preset is unknown.
 *
 * @param preset The preset to expand.
 *
 * @return The configuration of the preset.
 **/
jsentry_config jsentry_config_preset(JSENTRY_PRESET preset);

/**
 * jsentry_validate
 *
 * Validates a JSON document. On return the result output contains the
 * report: {"valid":bool,"violations":[...]}.
 *
 * @param json The JSON text, not necessarily NUL-terminated. (nonnull)
 * @param length The length of the JSON text in bytes.
 * @param config Limits and modes, NULL for the defaults. (nullable)
 * @param result Structure filled with the report. (nonnull)
 *
 * @return JSENTRY_OK if the document is valid, JSENTRY_VIOLATION if
 *         violations were found, an error code otherwise.
 **/
JSENTRY_RET_CODE jsentry_validate(const char *json, size_t length,
    const jsentry_config *config, jsentry_result *result);

/**
 * jsentry_sanitize
 *
 * Produces a sanitised copy of a JSON document in the result output. Text
 * which can't be parsed, or exceeds max_total_size_bytes, is not sanitised,
 * the output then contains the validation report.
 *
 * @param json The JSON text, not necessarily NUL-terminated. (nonnull)
 * @param length The length of the JSON text in bytes.
 * @param config Limits and modes, NULL for the defaults. (nullable)
 * @param remove_dangerous Whether dangerous keys are removed or escaped.
 * @param result Structure filled with the sanitised document. (nonnull)
 *
 * @return JSENTRY_OK on success, JSENTRY_VIOLATION if the text couldn't be
 *         sanitised, an error code otherwise.
 **/
JSENTRY_RET_CODE jsentry_sanitize(const char *json, size_t length,
    const jsentry_config *config, bool remove_dangerous, jsentry_result *result);

/**
 * jsentry_hash
 *
 * Computes the integrity hash of a JSON document: the lowercase hexadecimal
 * SHA-256 of its canonical form.
 *
 * @param json The JSON text, not necessarily NUL-terminated. (nonnull)
 * @param length The length of the JSON text in bytes.
 * @param result Structure filled with the hash. (nonnull)
 *
 * @return JSENTRY_OK on success, JSENTRY_ERR_INVALID_ARGUMENT if the text
 *         is malformed or too deeply nested, JSENTRY_ERR_INTERNAL otherwise.
 **/
JSENTRY_RET_CODE jsentry_hash(const char *json, size_t length, jsentry_result *result);

/**
 * jsentry_result_free
 *
 * Frees the memory held by a result.
 *
 * @param result The result to free. (nonnull)
 **/
void jsentry_result_free(jsentry_result *result);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*JSENTRY_H */
