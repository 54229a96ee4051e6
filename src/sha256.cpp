// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "sha256.hpp"

namespace jsentry {

namespace {

constexpr std::array<uint32_t, 64> round_constants{0x428a2f98, 0x71374491, 0xb5c0fbcf,
    0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01,
    0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1,
    0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351,
    0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb,
    0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819,
    0xd6990624, 0xf40e3585, 0x106aa070, 0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814,
    0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

constexpr uint32_t rotr(uint32_t x, unsigned n) { return (x >> n) | (x << (32 - n)); }

constexpr uint32_t load_be32(const uint8_t *p)
{
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

} // namespace

void sha256_hash::process_block(const uint8_t *block)
{
    std::array<uint32_t, 64> w{};
    for (std::size_t i = 0; i < 16; ++i) { w[i] = load_be32(block + i * 4); }
    for (std::size_t i = 16; i < 64; ++i) {
        const uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        const uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    auto [a, b, c, d, e, f, g, h] = state_;
    for (std::size_t i = 0; i < 64; ++i) {
        const uint32_t sum1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        const uint32_t choice = (e & f) ^ (~e & g);
        const uint32_t t1 = h + sum1 + choice + round_constants[i] + w[i];
        const uint32_t sum0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        const uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
        const uint32_t t2 = sum0 + majority;

        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
    state_[5] += f;
    state_[6] += g;
    state_[7] += h;
}

sha256_hash &sha256_hash::operator<<(std::string_view str)
{
    const auto *data = reinterpret_cast<const uint8_t *>(str.data());
    std::size_t remaining = str.size();
    total_length_ += remaining;

    if (buffered_ > 0) {
        const std::size_t count = std::min(remaining, block_size - buffered_);
        std::copy_n(data, count, buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_));
        buffered_ += count;
        data += count;
        remaining -= count;

        if (buffered_ < block_size) {
            return *this;
        }
        process_block(buffer_.data());
        buffered_ = 0;
    }

    for (; remaining >= block_size; remaining -= block_size, data += block_size) {
        process_block(data);
    }

    std::copy_n(data, remaining, buffer_.begin());
    buffered_ = remaining;
    return *this;
}

std::string sha256_hash::digest()
{
    const uint64_t length_bits = total_length_ * 8;

    // Padding: a single 1 bit, zeroes up to 56 bytes modulo 64, then the
    // message length in bits as a big endian 64-bit integer.
    buffer_[buffered_++] = 0x80;
    if (buffered_ > block_size - 8) {
        std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.end(), 0);
        process_block(buffer_.data());
        buffered_ = 0;
    }
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_),
        buffer_.end() - 8, 0);
    for (std::size_t i = 0; i < 8; ++i) {
        buffer_[block_size - 1 - i] = static_cast<uint8_t>(length_bits >> (i * 8));
    }
    process_block(buffer_.data());

    static constexpr std::string_view hex_digits{"0123456789abcdef"};

    std::string output;
    output.reserve(digest_length * 2);
    for (const uint32_t word : state_) {
        for (int shift = 28; shift >= 0; shift -= 4) {
            output.push_back(hex_digits[(word >> shift) & 0xF]);
        }
    }

    reset();
    return output;
}

} // namespace jsentry
