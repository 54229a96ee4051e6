// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include "integrity.hpp"
#include "json_utils.hpp"
#include "object.hpp"
#include "sha256.hpp"
#include "utils.hpp"

namespace jsentry::integrity {

std::string hash(const object &root)
{
    sha256_hash hasher;
    hasher << object_to_json(root, true);
    return hasher.digest();
}

bool verify(const object &root, std::string_view expected)
{
    return string_iequals(hash(root), expected);
}

} // namespace jsentry::integrity
