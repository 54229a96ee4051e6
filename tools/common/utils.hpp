// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "log.hpp"

void log_cb(jsentry::log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

std::string read_file(std::string_view filename);
