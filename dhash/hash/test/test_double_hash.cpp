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
#include <dhash/core/bytes.hpp>
#include <dhash/core/hex_literal.hpp>
#include <dhash/hash/digest.hpp>
#include <dhash/hash/double_hash.hpp>
#include <dhash/hash/hash_error.hpp>
#include <dhash/hash/sha256.hpp>

#include <evmc/evmc.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

using namespace dhash;
using namespace dhash::literals;
using namespace evmc::literals;

namespace
{
    Digest const ones{{1, 1, 1, 1, 1, 1, 1, 1}};
    Digest const twos{{2, 2, 2, 2, 2, 2, 2, 2}};

    byte_string_view text_bytes(std::string_view const s)
    {
        return to_byte_string_view(s);
    }

    // Forwards to the production hasher and records every input it sees
    struct RecordingHasher final : Sha256Hasher
    {
        mutable std::vector<byte_string> byte_calls;
        mutable std::vector<std::vector<uint32_t>> word_calls;
        mutable std::vector<sha256_words_t> outputs;

        sha256_words_t hash_bytes(byte_string_view const bytes) const override
        {
            byte_calls.emplace_back(bytes);
            outputs.push_back(default_sha256().hash_bytes(bytes));
            return outputs.back();
        }

        sha256_words_t
        hash_words(std::span<uint32_t const> const words) const override
        {
            word_calls.emplace_back(words.begin(), words.end());
            outputs.push_back(default_sha256().hash_words(words));
            return outputs.back();
        }
    };

    // Returns the first words it was given, padded with a marker
    struct EchoHasher final : Sha256Hasher
    {
        sha256_words_t hash_bytes(byte_string_view const bytes) const override
        {
            sha256_words_t out{};
            out.fill(0xeeeeeeee);
            out[0] = static_cast<uint32_t>(bytes.size());
            return out;
        }

        sha256_words_t
        hash_words(std::span<uint32_t const> const words) const override
        {
            sha256_words_t out{};
            out.fill(0xeeeeeeee);
            for (size_t i = 0; i < out.size() && i < words.size(); ++i) {
                out[i] = words[i] + 1;
            }
            return out;
        }
    };
}

TEST(DoubleHash, bytes_known_answer)
{
    EXPECT_EQ(
        to_bytes(double_hash(text_bytes("bitcoin"))),
        0xf1ef1bf105d788352c052453b15a913403be59b90ddf9f7c1f937edee8938dc5_bytes32);
    EXPECT_EQ(
        to_bytes(double_hash(byte_string_view{})),
        0x5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456_bytes32);
}

TEST(DoubleHash, words_known_answer)
{
    std::vector<uint32_t> const words{1, 2, 3, 4, 5, 6, 7};
    EXPECT_EQ(
        to_bytes(double_hash_words(words)),
        0x489b8eeb4024cb77ab057616ebf7f8d4405aa0bd3ad5f42e6b4c20580e011ac4_bytes32);
    EXPECT_EQ(
        double_hash_words(words),
        double_hash(
            0x00000001000000020000000300000004000000050000000600000007_hex));
}

TEST(DoubleHash, parent_known_answer)
{
    auto const parent = double_hash_parent(ones, twos);
    EXPECT_EQ(
        to_bytes(parent),
        0x14a6e4a4caef969126944266724d11866b39b3390cee070b0aa4c9390cd77f47_bytes32);

    std::vector<uint32_t> concatenated(
        ones.words().begin(), ones.words().end());
    concatenated.insert(
        concatenated.end(), twos.words().begin(), twos.words().end());
    EXPECT_EQ(parent, double_hash_words(concatenated));

    // order matters
    EXPECT_NE(double_hash_parent(twos, ones), parent);
}

TEST(DoubleHash, is_sha256_of_sha256)
{
    auto const bytes =
        text_bytes("The quick brown fox jumps over the lazy dog");
    auto const first = sha256(bytes);
    EXPECT_EQ(double_hash(bytes), Digest{sha256(first)});

    auto const first_bytes = to_big_endian_bytes(first);
    EXPECT_EQ(first_bytes.size(), 32);
    EXPECT_EQ(
        double_hash(bytes), Digest{sha256(byte_string_view{first_bytes})});
}

TEST(DoubleHash, second_pass_hashes_first_output)
{
    RecordingHasher const hasher;
    auto const d = double_hash(text_bytes("bitcoin"), hasher);

    ASSERT_EQ(hasher.byte_calls.size(), 1);
    ASSERT_EQ(hasher.word_calls.size(), 1);
    ASSERT_EQ(hasher.outputs.size(), 2);
    EXPECT_EQ(hasher.byte_calls[0], byte_string(text_bytes("bitcoin")));
    EXPECT_THAT(
        hasher.word_calls[0], testing::ElementsAreArray(hasher.outputs[0]));
    EXPECT_EQ(d.words(), hasher.outputs[1]);
    EXPECT_EQ(d, double_hash(text_bytes("bitcoin")));
}

TEST(DoubleHash, parent_makes_two_word_passes)
{
    RecordingHasher const hasher;
    auto const d = double_hash_parent(ones, twos, hasher);

    EXPECT_TRUE(hasher.byte_calls.empty());
    ASSERT_EQ(hasher.word_calls.size(), 2);
    EXPECT_THAT(
        hasher.word_calls[0],
        testing::ElementsAre(1, 1, 1, 1, 1, 1, 1, 1, 2, 2, 2, 2, 2, 2, 2, 2));
    EXPECT_THAT(
        hasher.word_calls[1], testing::ElementsAreArray(hasher.outputs[0]));
    EXPECT_EQ(d, double_hash_parent(ones, twos));
}

TEST(DoubleHash, injected_hasher_is_used)
{
    EchoHasher const hasher;
    std::vector<uint32_t> const words{10, 20};

    // first pass {11, 21, e...}, second pass adds one to each word again
    EXPECT_EQ(
        double_hash_words(words, hasher),
        Digest(
            {12,
             22,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef}));

    EXPECT_EQ(
        double_hash(text_bytes("abc"), hasher),
        Digest(
            {4,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef,
             0xeeeeeeef}));
}

TEST(DoubleHash, word_bytes_aligned)
{
    auto const bytes =
        0x00000001000000020000000300000004000000050000000600000007_hex;
    auto const res = double_hash_word_bytes(bytes);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(
        res.value(),
        double_hash_words(std::vector<uint32_t>{1, 2, 3, 4, 5, 6, 7}));
    EXPECT_EQ(res.value(), double_hash(bytes));

    auto const empty = double_hash_word_bytes(byte_string_view{});
    ASSERT_FALSE(empty.has_error());
    EXPECT_EQ(empty.value(), double_hash(byte_string_view{}));
}

TEST(DoubleHash, word_bytes_misaligned)
{
    for (auto const &s : {"bitcoin", "a", "abcde", "abcdef"}) {
        auto const res = double_hash_word_bytes(text_bytes(s));
        ASSERT_TRUE(res.has_error()) << s;
        EXPECT_EQ(res.error(), HashError::MisalignedInput) << s;
    }
}

TEST(DoubleHash, word_bytes_misaligned_skips_hasher)
{
    RecordingHasher const hasher;
    auto const res = double_hash_word_bytes(0x0102030405_hex, hasher);
    ASSERT_TRUE(res.has_error());
    EXPECT_TRUE(hasher.byte_calls.empty());
    EXPECT_TRUE(hasher.word_calls.empty());
}
