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

#include <optional>
#include <string_view>

DHASH_NAMESPACE_BEGIN

inline constexpr unsigned char from_hex_digit(char const h)
{
    if (h >= '0' && h <= '9') {
        return static_cast<unsigned char>(h - '0');
    }
    else if (h >= 'a' && h <= 'f') {
        return static_cast<unsigned char>(h - 'a' + 10);
    }
    else if (h >= 'A' && h <= 'F') {
        return static_cast<unsigned char>(h - 'A' + 10);
    }
    else {
        return 0xff;
    }
}

/**
 * decodes a hex string with an optional 0x prefix, an odd leading nibble is
 * taken as a whole byte. returns nullopt on a non hex character
 */
inline std::optional<byte_string> try_from_hex(std::string_view s)
{
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
    }

    byte_string r((s.size() + 1) / 2, (unsigned char)0);
    size_t in = 0, out = 0;
    // handle odd nibbles
    if (s.size() % 2) {
        auto const v = from_hex_digit(s[in++]);
        if (v == 0xff) {
            return std::nullopt;
        }
        r[out++] = v;
    }
    bool odd = true;
    unsigned char hi_nibble = 0;

    for (; in < s.size(); ++in) {
        auto const v = from_hex_digit(s[in]);
        if (v == 0xff) {
            return std::nullopt;
        }
        if (odd) {
            hi_nibble = static_cast<unsigned char>(v << 4);
        }
        else {
            r[out++] = hi_nibble | v;
        }

        odd = !odd;
    }

    return r;
}

inline byte_string from_hex(std::string_view const s)
{
    // invalid input, return empty
    return try_from_hex(s).value_or(byte_string{});
}

namespace literals
{
    inline byte_string operator""_hex(char const *s)
    {
        return from_hex(s);
    }
};

DHASH_NAMESPACE_END
