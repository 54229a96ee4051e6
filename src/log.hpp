// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

namespace jsentry::detail {

// Strips the directories from __FILE__ at compile time
constexpr const char *file_name(const char *path)
{
    const char *name = path;
    for (; *path != '\0'; ++path) {
        if (*path == '/' || *path == '\\') {
            name = path + 1;
        }
    }
    return name;
}

} // namespace jsentry::detail

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define JSENTRY_LOG_HELPER(level, function, file, line, fmt_str, ...)                              \
    {                                                                                              \
        if (jsentry::logger::valid(level)) {                                                       \
            try {                                                                                  \
                constexpr const char *filename = jsentry::detail::file_name(file);                 \
                auto message = fmt::format(fmt_str, ##__VA_ARGS__);                                \
                jsentry::logger::log(                                                              \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (const std::exception &) {}                                                    \
        }                                                                                          \
    }

#define JSENTRY_LOG(level, fmt, ...)                                                               \
    JSENTRY_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define JSENTRY_TRACE(fmt, ...) JSENTRY_LOG(jsentry::log_level::trace, fmt, ##__VA_ARGS__)
#define JSENTRY_DEBUG(fmt, ...) JSENTRY_LOG(jsentry::log_level::debug, fmt, ##__VA_ARGS__)
#define JSENTRY_INFO(fmt, ...) JSENTRY_LOG(jsentry::log_level::info, fmt, ##__VA_ARGS__)
#define JSENTRY_WARN(fmt, ...) JSENTRY_LOG(jsentry::log_level::warn, fmt, ##__VA_ARGS__)
#define JSENTRY_ERROR(fmt, ...) JSENTRY_LOG(jsentry::log_level::error, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace jsentry {

// Same values as JSENTRY_LOG_LEVEL in jsentry.h
// NOLINTNEXTLINE(performance-enum-size)
enum class log_level : uint32_t { trace, debug, info, warn, error, off };

std::string_view log_level_to_str(log_level level);
// Case-insensitive inverse of log_level_to_str
std::optional<log_level> log_level_from_str(std::string_view str);

// Messages are dropped until a callback is installed through init, either by
// jsentry_set_log_cb or by a tool.
class logger {
public:
    using log_cb_type = void (*)(log_level level, const char *function, const char *file,
        unsigned line, const char *message, uint64_t message_len);

    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level) { return cb != nullptr && level >= min_level; }
    static void log(log_level level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static log_cb_type cb;
    static log_level min_level;
};

} // namespace jsentry
