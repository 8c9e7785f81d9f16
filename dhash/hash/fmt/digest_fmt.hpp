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

#include <dhash/core/basic_formatter.hpp>
#include <dhash/core/bytes.hpp>
#include <dhash/hash/digest.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <span>

template <>
struct quill::copy_loggable<dhash::Digest> : std::true_type
{
};

template <unsigned N>
struct quill::copy_loggable<intx::uint<N>> : std::true_type
{
};

template <>
struct fmt::formatter<dhash::Digest> : public dhash::BasicFormatter
{
    template <typename FormatContext>
    auto format(dhash::Digest const &value, FormatContext &ctx) const
    {
        auto const bytes = dhash::to_bytes(value);
        fmt::format_to(
            ctx.out(),
            "0x{:02x}",
            fmt::join(std::as_bytes(std::span(bytes.bytes)), ""));
        return ctx.out();
    }
};

template <unsigned N>
struct fmt::formatter<intx::uint<N>> : public dhash::BasicFormatter
{
    template <typename FormatContext>
    auto format(intx::uint<N> const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "0x{}", intx::to_string(value, 16));
        return ctx.out();
    }
};
