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

#include <dhash/core/byte_string.hpp>
#include <dhash/core/config.hpp>
#include <dhash/core/unaligned.hpp>
#include <dhash/hash/sha256.hpp>

#include <silkpre/sha256.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

DHASH_ANONYMOUS_NAMESPACE_BEGIN

sha256_words_t silkpre_sha256_words(byte_string_view const bytes)
{
    unsigned char out[32];
    silkpre_sha256(
        out, bytes.data(), bytes.size(), true /* use_cpu_extensions */);

    sha256_words_t words;
    for (size_t i = 0; i < words.size(); ++i) {
        words[i] = load_be32(out + 4 * i);
    }
    return words;
}

DHASH_ANONYMOUS_NAMESPACE_END

DHASH_NAMESPACE_BEGIN

sha256_words_t SilkpreSha256::hash_bytes(byte_string_view const bytes) const
{
    return silkpre_sha256_words(bytes);
}

sha256_words_t
SilkpreSha256::hash_words(std::span<uint32_t const> const words) const
{
    return silkpre_sha256_words(to_big_endian_bytes(words));
}

Sha256Hasher const &default_sha256() noexcept
{
    static SilkpreSha256 const hasher;
    return hasher;
}

sha256_words_t sha256(byte_string_view const bytes)
{
    return silkpre_sha256_words(bytes);
}

sha256_words_t sha256(std::span<uint32_t const> const words)
{
    return silkpre_sha256_words(to_big_endian_bytes(words));
}

byte_string to_big_endian_bytes(std::span<uint32_t const> const words)
{
    byte_string bytes(words.size() * sizeof(uint32_t), (unsigned char)0);
    for (size_t i = 0; i < words.size(); ++i) {
        store_be32(bytes.data() + sizeof(uint32_t) * i, words[i]);
    }
    return bytes;
}

std::vector<uint32_t> from_big_endian_bytes(byte_string_view const bytes)
{
    std::vector<uint32_t> words(bytes.size() / sizeof(uint32_t));
    for (size_t i = 0; i < words.size(); ++i) {
        words[i] = load_be32(bytes.data() + sizeof(uint32_t) * i);
    }
    return words;
}

DHASH_NAMESPACE_END
