// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "object.hpp"

namespace jsentry::integrity {

// SHA-256 of the canonical serialisation, lowercase hexadecimal. Trees
// which compare equal produce the same digest regardless of key order.
std::string hash(const object &root);

// Case-insensitive comparison of the digest of root against expected
bool verify(const object &root, std::string_view expected);

} // namespace jsentry::integrity
