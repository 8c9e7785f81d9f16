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

#include <dhash/core/int.hpp>
#include <dhash/core/math.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace dhash;

namespace
{
    template <class T>
    T repeated_mul(T const base, unsigned const exponent)
    {
        T result{1};
        for (unsigned i = 0; i < exponent; ++i) {
            result = static_cast<T>(result * base);
        }
        return result;
    }
}

TEST(math, fast_pow_matches_repeated_multiplication)
{
    for (uint64_t const base : {0u, 1u, 2u, 3u, 7u, 10u}) {
        for (unsigned const exp : {0u, 1u, 2u, 5u, 10u}) {
            EXPECT_EQ(fast_pow(base, exp), repeated_mul(base, exp))
                << base << "^" << exp;
        }
    }
}

TEST(math, fast_pow_zero_exponent)
{
    EXPECT_EQ(fast_pow(uint32_t{0}, 0u), 1);
    EXPECT_EQ(fast_pow(uint32_t{12345}, uint8_t{0}), 1);
    EXPECT_EQ(fast_pow(uint256_t{0}, uint64_t{0}), 1);
}

TEST(math, fast_pow_mixed_types)
{
    EXPECT_EQ(fast_pow(uint64_t{2}, uint8_t{63}), uint64_t{1} << 63);
    EXPECT_EQ(fast_pow(uint256_t{2}, 255u), uint256_t{1} << 255);
    EXPECT_EQ(fast_pow(uint128_t{3}, uint128_t{4}), 81);
    EXPECT_EQ(fast_pow(int64_t{-2}, 3u), -8);
}

TEST(math, fast_pow_wraps)
{
    EXPECT_EQ(fast_pow(uint32_t{2}, 32u), 0);
    EXPECT_EQ(fast_pow(uint8_t{3}, 5u), uint8_t{243});
    EXPECT_EQ(fast_pow(uint8_t{3}, 6u), uint8_t{729 % 256});
    EXPECT_EQ(
        fast_pow(uint16_t{255}, 3u), uint16_t{(255u * 255u * 255u) % 65536u});
}

TEST(math, shift_by_zero)
{
    for (uint32_t const v : {0u, 1u, 0x80000000u, 0xdeadbeefu, 0xffffffffu}) {
        EXPECT_EQ(shl(v, 0u), v);
        EXPECT_EQ(shr(v, 0u), v);
    }
}

TEST(math, shift_past_width)
{
    for (uint32_t const v : {0u, 1u, 0x80000000u, 0xdeadbeefu, 0xffffffffu}) {
        EXPECT_EQ(shl(v, 32u), 0);
        EXPECT_EQ(shr(v, 32u), 0);
        EXPECT_EQ(shl(v, uint8_t{255}), 0);
        EXPECT_EQ(shr(v, uint64_t{1} << 40), 0);
    }
    EXPECT_EQ(shl(UINT256_MAX, 256u), 0);
    EXPECT_EQ(shr(UINT256_MAX, 256u), 0);
}

TEST(math, shift_matches_builtin)
{
    for (uint32_t const v : {1u, 3u, 0x80000000u, 0xdeadbeefu, 0xffffffffu}) {
        for (unsigned s = 0; s < 32; ++s) {
            EXPECT_EQ(shl(v, s), static_cast<uint32_t>(v << s))
                << v << " " << s;
            EXPECT_EQ(shr(v, s), v >> s) << v << " " << s;
        }
    }
    uint8_t const b = 0xa5;
    EXPECT_EQ(shl(b, 4u), uint8_t{0x50});
    EXPECT_EQ(shr(b, 4u), uint8_t{0x0a});
    EXPECT_EQ(shl(b, 7u), uint8_t{0x80});
    EXPECT_EQ(shl(b, 8u), 0);
}

TEST(math, shift_extended_types)
{
    uint256_t const x = UINT256_MAX;
    EXPECT_EQ(shr(x, 255u), 1);
    EXPECT_EQ(shl(x, 255u), uint256_t{1} << 255);
    EXPECT_EQ(shr(x, 128u), uint256_t{UINT128_MAX});
    EXPECT_EQ(shl(uint128_t{0xffffffff}, 96u), uint128_t{0xffffffff} << 96);
    EXPECT_EQ(shl(uint128_t{0xffffffff}, 97u), uint128_t{0x7fffffff} << 97);
    EXPECT_EQ(shr(uint128_t{1} << 127, 127u), 1);
    EXPECT_EQ(shr(uint128_t{1} << 127, 128u), 0);
}
