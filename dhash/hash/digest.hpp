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

#include <dhash/core/bytes.hpp>
#include <dhash/core/config.hpp>
#include <dhash/core/int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

DHASH_NAMESPACE_BEGIN

/**
 * A 256-bit hash held as eight 32-bit words. Word 0 is the most significant
 * word of the numeric view and the first four bytes of the byte view.
 */
class Digest
{
public:
    static constexpr size_t num_words = 8;

    using words_type = std::array<uint32_t, num_words>;

    constexpr Digest() noexcept = default;

    constexpr explicit Digest(words_type const &words) noexcept
        : words_{words}
    {
    }

    constexpr words_type const &words() const noexcept
    {
        return words_;
    }

    constexpr uint32_t operator[](size_t const i) const noexcept
    {
        return words_[i];
    }

    friend constexpr bool
    operator==(Digest const &, Digest const &) noexcept = default;

private:
    words_type words_{};
};

static_assert(sizeof(Digest) == 32);

constexpr Digest from_words(Digest::words_type const &words) noexcept
{
    return Digest{words};
}

uint256_t to_uint256(Digest const &);

Digest from_uint256(uint256_t const &);

bytes32_t to_bytes(Digest const &) noexcept;

Digest from_bytes(bytes32_t const &) noexcept;

DHASH_NAMESPACE_END
