// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jsentry {

// Streaming SHA-256 (FIPS 180-4)
class sha256_hash {
public:
    sha256_hash() = default;
    ~sha256_hash() = default;
    sha256_hash(const sha256_hash &) = delete;
    sha256_hash(sha256_hash &&) = delete;
    sha256_hash &operator=(const sha256_hash &) = delete;
    sha256_hash &operator=(sha256_hash &&) noexcept = delete;

    sha256_hash &operator<<(std::string_view str);

    // Lowercase hexadecimal digest of everything written since the last
    // reset, the hash is reset afterwards.
    [[nodiscard]] std::string digest();

    void reset()
    {
        state_ = initial_hash_values;
        total_length_ = 0;
        buffered_ = 0;
    }

    static constexpr std::size_t digest_length = 32;

protected:
    static constexpr std::size_t block_size = 64;
    static constexpr std::array<uint32_t, 8> initial_hash_values{0x6a09e667, 0xbb67ae85,
        0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};

    void process_block(const uint8_t *block);

    std::array<uint32_t, 8> state_{initial_hash_values};
    // Bytes written, the padding stores it in bits
    uint64_t total_length_{0};
    std::array<uint8_t, block_size> buffer_{};
    std::size_t buffered_{0};
};

} // namespace jsentry
