// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include "config.hpp"
#include "object.hpp"

namespace jsentry {

// Builds a configuration from a parsed JSON map such as
//
//   {"preset": "api", "max_depth": 4, "strict_mode": false}
//
// The optional preset provides the base values, every other field overrides
// it. Throws parsing_error on unknown fields or invalid values.
validation_config parse_config(const object &root);

} // namespace jsentry
