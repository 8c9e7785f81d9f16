// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <dhash/core/bytes.hpp>
#include <dhash/core/config.hpp>
#include <dhash/core/int.hpp>
#include <dhash/core/math.hpp>
#include <dhash/core/unaligned.hpp>
#include <dhash/hash/digest.hpp>

#include <cstddef>
#include <cstdint>

DHASH_ANONYMOUS_NAMESPACE_BEGIN

constexpr unsigned limb_bits = 32;
constexpr unsigned half_bits = 128;
constexpr size_t limbs_per_half = 4;

// limbs[0] is the most significant
uint128_t join_limbs(uint32_t const *const limbs)
{
    uint128_t half = 0;
    for (size_t i = 0; i < limbs_per_half; ++i) {
        half |= shl(uint128_t{limbs[limbs_per_half - 1 - i]}, limb_bits * i);
    }
    return half;
}

void split_limbs(uint128_t half, uint32_t *const limbs)
{
    uint128_t const mask{0xffffffff};
    for (size_t i = 0; i < limbs_per_half; ++i) {
        limbs[limbs_per_half - 1 - i] = static_cast<uint32_t>(half & mask);
        half = shr(half, limb_bits);
    }
}

DHASH_ANONYMOUS_NAMESPACE_END

DHASH_NAMESPACE_BEGIN

uint256_t to_uint256(Digest const &d)
{
    auto const &words = d.words();
    uint128_t const high = join_limbs(&words[0]);
    uint128_t const low = join_limbs(&words[limbs_per_half]);
    return shl(uint256_t{high}, half_bits) | uint256_t{low};
}

Digest from_uint256(uint256_t const &n)
{
    auto const high = static_cast<uint128_t>(shr(n, half_bits));
    auto const low = static_cast<uint128_t>(n);

    Digest::words_type words;
    split_limbs(high, &words[0]);
    split_limbs(low, &words[limbs_per_half]);
    return Digest{words};
}

bytes32_t to_bytes(Digest const &d) noexcept
{
    bytes32_t b;
    for (size_t i = 0; i < Digest::num_words; ++i) {
        store_be32(b.bytes + 4 * i, d[i]);
    }
    return b;
}

Digest from_bytes(bytes32_t const &b) noexcept
{
    Digest::words_type words;
    for (size_t i = 0; i < Digest::num_words; ++i) {
        words[i] = load_be32(b.bytes + 4 * i);
    }
    return Digest{words};
}

DHASH_NAMESPACE_END
