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

#pragma once

#include <dhash/core/config.hpp>

#include <dhash/core/int.hpp>

#include <concepts>
#include <limits>
#include <type_traits>
#include <utility>

DHASH_NAMESPACE_BEGIN

template <class T>
concept multiplicative = requires(T const a, T const b) {
    T{0};
    T{1};
    a * b;
};

template <class U>
concept halvable = requires(U const a, U const b) {
    U{0};
    U{1};
    a + b;
    a / b;
    a % b;
    { a == b } -> std::convertible_to<bool>;
};

namespace detail
{
    // builtin types narrower than int would be promoted to signed int
    template <class T>
    using mul_t = std::conditional_t<
        std::is_integral_v<T> && (sizeof(T) < sizeof(unsigned)), unsigned, T>;

    template <class T>
    constexpr T mul(T const a, T const b)
    {
        return static_cast<T>(
            static_cast<mul_t<T>>(a) * static_cast<mul_t<T>>(b));
    }
}

/**
 * returns base^exponent by square and multiply
 *
 * @warning overflow is whatever multiplication of T does, nothing is masked
 */
template <multiplicative T, halvable U>
constexpr T fast_pow(T base, U exponent)
{
    U const zero{0};
    U const one{1};
    U const two = static_cast<U>(one + one);

    T result{1};
    while (!(exponent == zero)) {
        if (exponent % two == one) {
            result = detail::mul(result, base);
        }
        exponent = static_cast<U>(exponent / two);
        base = detail::mul(base, base);
    }
    return result;
}

/**
 * logical shift left computed as value * 2^shift, zero once shift reaches
 * the bit width of T
 */
template <unsigned_integral T, std::unsigned_integral U>
constexpr T shl(T const value, U const shift)
{
    constexpr int max_shift = std::numeric_limits<T>::digits - 1;
    if (std::cmp_greater(shift, max_shift)) {
        return T{0};
    }
    return detail::mul(value, fast_pow(T{2}, shift));
}

/**
 * logical shift right computed as value / 2^shift, zero once shift reaches
 * the bit width of T
 */
template <unsigned_integral T, std::unsigned_integral U>
constexpr T shr(T const value, U const shift)
{
    constexpr int max_shift = std::numeric_limits<T>::digits - 1;
    if (std::cmp_greater(shift, max_shift)) {
        return T{0};
    }
    return static_cast<T>(value / fast_pow(T{2}, shift));
}

DHASH_NAMESPACE_END
