// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace jsentry {

struct validation_config {
    static constexpr uint32_t default_max_depth = 10;
    static constexpr uint64_t default_max_total_size_bytes = 1'000'000;
    static constexpr uint32_t default_max_string_length = 10'000;
    static constexpr uint32_t default_max_array_length = 1'000;
    static constexpr uint32_t default_max_keys = 1'000;

    uint32_t max_depth{default_max_depth};
    uint64_t max_total_size_bytes{default_max_total_size_bytes};
    // Counted in codepoints
    uint32_t max_string_length{default_max_string_length};
    uint32_t max_array_length{default_max_array_length};
    uint32_t max_keys{default_max_keys};
    bool allow_dangerous_keys{false};
    bool strict_mode{true};

    bool operator==(const validation_config &) const = default;
};

enum class preset : uint8_t { strict, relaxed, api };

// High-security environments
constexpr validation_config strict_preset()
{
    validation_config config;
    config.max_depth = 5;
    config.max_total_size_bytes = 50'000;
    return config;
}

// Trusted environments, violations are advisory
constexpr validation_config relaxed_preset()
{
    validation_config config;
    config.max_depth = 20;
    config.max_total_size_bytes = 10'000'000;
    config.allow_dangerous_keys = true;
    config.strict_mode = false;
    return config;
}

// Public API endpoints
constexpr validation_config api_preset()
{
    validation_config config;
    config.max_keys = 100;
    config.max_array_length = 100;
    return config;
}

constexpr validation_config config_from_preset(preset value)
{
    switch (value) {
    case preset::strict:
        return strict_preset();
    case preset::relaxed:
        return relaxed_preset();
    case preset::api:
        return api_preset();
    }
    return {};
}

std::optional<preset> preset_from_string(std::string_view str);
std::string_view to_string(preset value);

} // namespace jsentry
