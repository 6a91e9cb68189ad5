// Copyright © 2025 Christian Persch
// Copyright © 2026 the copa authors
//
// This library is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published
// by the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This library is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this library.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

// fmt has only partial support for char32_t, so copa formats
// text as UTF-8 char strings. A char32_t or a u32string_view is
// wrapped in a boxed to select the formatters below, since
// fmt refuses formatter<std::u32string_view, char> otherwise.

#include <fmt/format.h>

#include <string_view>

#include "boxed.hh"

FMT_BEGIN_NAMESPACE

template<>
struct formatter<copa::boxed<std::u32string_view>, char>
        : public formatter<std::string_view, char> {
public:
        auto format(copa::boxed<std::u32string_view> const& str,
                    format_context& ctx) const -> format_context::iterator;
};

// Formats a character as UTF-8, or as <U+XXXX> if it is not
// printable. With the 'u' option, always shows the code point.
template<>
struct formatter<copa::boxed<char32_t>, char> {
private:
        bool m_codepoint{false};

public:
        constexpr formatter() = default;

        constexpr auto parse(format_parse_context& ctx) -> format_parse_context::iterator
        {
                auto it = ctx.begin();
                while (it != ctx.end()) {
                        if (*it == 'u')
                                m_codepoint = true;
                        else if (*it == '}')
                                break;
                        else
                                throw format_error{"Invalid format string"};
                        ++it;
                }

                return it;
        }

        auto format(copa::boxed<char32_t> const& c,
                    format_context& ctx) const -> format_context::iterator;
};

FMT_END_NAMESPACE
