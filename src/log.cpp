// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <string_view>

#include "log.hpp"
#include "utils.hpp"

namespace jsentry {

std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warn:
        return "warn";
    case log_level::error:
        return "error";
    case log_level::off:
        break;
    }
    return "off";
}

std::optional<log_level> log_level_from_str(std::string_view str)
{
    for (auto level : {log_level::trace, log_level::debug, log_level::info, log_level::warn,
             log_level::error, log_level::off}) {
        if (string_iequals(log_level_to_str(level), str)) {
            return level;
        }
    }
    return std::nullopt;
}

logger::log_cb_type logger::cb = nullptr;
log_level logger::min_level = log_level::off;

void logger::init(log_cb_type cb, log_level min_level)
{
    logger::cb = cb;
    logger::min_level = min_level;
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    // The callback may have been reset between valid() and log()
    if (logger::cb == nullptr) {
        return;
    }
    logger::cb(level, function, file, line, message, length);
}

} // namespace jsentry
