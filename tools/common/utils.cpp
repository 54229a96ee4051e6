// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <ios>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include "log.hpp"
#include "utils.hpp"

void log_cb(jsentry::log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << jsentry::log_level_to_str(level) << "][" << file << ":" << function
              << ":" << line << "]: " << message << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream input_file(std::string{filename}, std::ios::in | std::ios::binary);
    if (!input_file) {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    input_file.seekg(0, std::ios::end);
    buffer.resize(static_cast<std::size_t>(input_file.tellg()));
    input_file.seekg(0, std::ios::beg);

    input_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    return buffer;
}
