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

#include <dhash/core/assert.h>
#include <dhash/core/byte_string.hpp>
#include <dhash/core/config.hpp>
#include <dhash/core/likely.h>
#include <dhash/core/result.hpp>
#include <dhash/hash/digest.hpp>
#include <dhash/hash/double_hash.hpp>
#include <dhash/hash/hash_error.hpp>
#include <dhash/hash/sha256.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>

DHASH_ANONYMOUS_NAMESPACE_BEGIN

Digest second_pass(sha256_words_t const &first, Sha256Hasher const &hasher)
{
    return Digest{hasher.hash_words(first)};
}

DHASH_ANONYMOUS_NAMESPACE_END

DHASH_NAMESPACE_BEGIN

Digest double_hash(byte_string_view const bytes, Sha256Hasher const &hasher)
{
    return second_pass(hasher.hash_bytes(bytes), hasher);
}

Digest double_hash(byte_string_view const bytes)
{
    return double_hash(bytes, default_sha256());
}

Digest double_hash_words(
    std::span<uint32_t const> const words, Sha256Hasher const &hasher)
{
    return second_pass(hasher.hash_words(words), hasher);
}

Digest double_hash_words(std::span<uint32_t const> const words)
{
    return double_hash_words(words, default_sha256());
}

Digest double_hash_parent(
    Digest const &left, Digest const &right, Sha256Hasher const &hasher)
{
    std::array<uint32_t, 2 * Digest::num_words> words;
    std::copy(
        right.words().begin(),
        right.words().end(),
        std::copy(left.words().begin(), left.words().end(), words.begin()));
    return double_hash_words(words, hasher);
}

Digest double_hash_parent(Digest const &left, Digest const &right)
{
    return double_hash_parent(left, right, default_sha256());
}

Result<Digest> double_hash_word_bytes(
    byte_string_view const bytes, Sha256Hasher const &hasher)
{
    if (DHASH_UNLIKELY(bytes.size() % sizeof(uint32_t) != 0)) {
        return HashError::MisalignedInput;
    }
    auto const words = from_big_endian_bytes(bytes);
    DHASH_ASSERT(words.size() * sizeof(uint32_t) == bytes.size());
    return double_hash_words(words, hasher);
}

Result<Digest> double_hash_word_bytes(byte_string_view const bytes)
{
    return double_hash_word_bytes(bytes, default_sha256());
}

DHASH_NAMESPACE_END
