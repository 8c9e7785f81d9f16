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
#include <dhash/core/result.hpp>
#include <dhash/hash/digest.hpp>
#include <dhash/hash/sha256.hpp>

#include <cstdint>
#include <span>

DHASH_NAMESPACE_BEGIN

//! SHA-256 applied twice, the second pass over the eight words of the first
Digest double_hash(byte_string_view, Sha256Hasher const &);

Digest double_hash(byte_string_view);

/**
 * Same as double_hash() with a first pass over whole words. Data meant as a
 * byte count that is not a multiple of four cannot be represented here, see
 * double_hash_word_bytes().
 */
Digest double_hash_words(std::span<uint32_t const>, Sha256Hasher const &);

Digest double_hash_words(std::span<uint32_t const>);

//! Merkle parent: double hash of the sixteen words of left then right
Digest double_hash_parent(
    Digest const &left, Digest const &right, Sha256Hasher const &);

Digest double_hash_parent(Digest const &left, Digest const &right);

/**
 * Reads the input as big endian words and double hashes them. Fails with
 * HashError::MisalignedInput rather than dropping a partial trailing word.
 */
Result<Digest> double_hash_word_bytes(byte_string_view, Sha256Hasher const &);

Result<Digest> double_hash_word_bytes(byte_string_view);

DHASH_NAMESPACE_END
