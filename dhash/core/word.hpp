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

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

DHASH_NAMESPACE_BEGIN

/**
 * parses a 32-bit word written in decimal, or in hex with a 0x prefix. a
 * leading zero is decimal, signs and trailing characters are rejected
 */
inline std::optional<uint32_t> parse_word(std::string_view s)
{
    int base = 10;
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
        base = 16;
    }
    // from_chars accepts '-' for unsigned types
    if (s.empty() || s[0] == '-' || s[0] == '+') {
        return std::nullopt;
    }
    uint32_t word = 0;
    auto const [ptr, ec] =
        std::from_chars(s.data(), s.data() + s.size(), word, base);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return word;
}

DHASH_NAMESPACE_END
