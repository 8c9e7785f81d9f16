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

#include <dhash/core/byte_string.hpp>
#include <dhash/core/config.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <vector>

DHASH_NAMESPACE_BEGIN

//! SHA-256 output, eight words each read big endian from the digest bytes
using sha256_words_t = std::array<uint32_t, 8>;

//! \brief Single pass SHA-256 capability consumed by the double hash
class Sha256Hasher
{
public:
    virtual ~Sha256Hasher() = default;

    virtual sha256_words_t hash_bytes(byte_string_view) const = 0;

    //! Hashes the big endian byte encoding of the words. The input is taken
    //! as word aligned content, only the SHA-256 message padding is applied.
    virtual sha256_words_t hash_words(std::span<uint32_t const>) const = 0;
};

class SilkpreSha256 final : public Sha256Hasher
{
public:
    sha256_words_t hash_bytes(byte_string_view) const override;
    sha256_words_t hash_words(std::span<uint32_t const>) const override;
};

Sha256Hasher const &default_sha256() noexcept;

sha256_words_t sha256(byte_string_view);

sha256_words_t sha256(std::span<uint32_t const>);

byte_string to_big_endian_bytes(std::span<uint32_t const>);

//! trailing bytes that do not fill a word are dropped
std::vector<uint32_t> from_big_endian_bytes(byte_string_view);

DHASH_NAMESPACE_END
