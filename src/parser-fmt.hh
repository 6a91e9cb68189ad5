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

#include "parser.hh"

#include <string_view>

#include "fmt-glue.hh"

#include "boxed.hh"

namespace copa::parser
{
        namespace detail {

                struct control_tag {};

        } // namespace detail

        using control_t = copa::boxed<uint8_t, detail::control_tag>;

        namespace detail {

                auto state_to_sv(State state) noexcept -> std::string_view;
                auto action_to_sv(Action action) noexcept -> std::string_view;
                auto control_to_sv(control_t const& ctrl) noexcept -> std::string_view;

        } // namespace detail
} // namespace copa::parser

FMT_BEGIN_NAMESPACE

template<>
struct formatter<copa::parser::State, char> : public formatter<std::string_view> {
public:
        auto format(copa::parser::State const& state,
                    format_context& ctx) const -> format_context::iterator
        {
                return formatter<std::string_view, char>::format(copa::parser::detail::state_to_sv(state), ctx);
        }
};

template<>
struct formatter<copa::parser::Action, char> : public formatter<std::string_view> {
public:
        auto format(copa::parser::Action const& action,
                    format_context& ctx) const -> format_context::iterator
        {
                return formatter<std::string_view, char>::format(copa::parser::detail::action_to_sv(action), ctx);
        }
};

// Formats a C0 or C1 control by its name, e.g. LF or CSI,
// and any other byte in hex.
template<>
struct formatter<copa::parser::control_t, char> : public formatter<std::string_view> {
public:
        auto format(copa::parser::control_t const& ctrl,
                    format_context& ctx) const -> format_context::iterator
        {
                if (auto const sv = copa::parser::detail::control_to_sv(ctrl); !sv.empty())
                        return formatter<std::string_view, char>::format(sv, ctx);

                return fmt::format_to(ctx.out(), "{:#04x}", ctrl.get());
        }
};

// Formats parameters the way they appear in the sequence, e.g. "1;;3:4",
// with default parameters left empty.
template<>
struct formatter<copa::parser::Params> {
public:
        constexpr auto parse(format_parse_context& ctx) -> format_parse_context::iterator
        {
                auto it = ctx.begin();
                if (it != ctx.end() && *it != '}')
                        throw format_error{"Invalid format string"};
                return it;
        }

        auto format(copa::parser::Params const& params,
                    format_context& ctx) const -> format_context::iterator
        {
                auto&& it = ctx.out();

                auto const size = params.size();
                for (auto i = 0u; i < size; i++) {
                        if (!params.param_default(i))
                                it = fmt::format_to(it, "{}", params.param(i));
                        if (i + 1 < size) {
                                *it = params.param_nonfinal(i) ? ':' : ';';
                                ++it;
                        }
                }

                ctx.advance_to(it);
                return it;
        }
};

// Formats intermediates separated by spaces, with SP for 2/0.
template<>
struct formatter<copa::parser::Intermediates> {
public:
        constexpr auto parse(format_parse_context& ctx) -> format_parse_context::iterator
        {
                auto it = ctx.begin();
                if (it != ctx.end() && *it != '}')
                        throw format_error{"Invalid format string"};
                return it;
        }

        auto format(copa::parser::Intermediates const& intermediates,
                    format_context& ctx) const -> format_context::iterator
        {
                auto&& it = ctx.out();

                auto first = true;
                for (auto const c : intermediates) {
                        if (!first) {
                                *it = ' '; ++it;
                        }
                        first = false;

                        if (c == 0x20) {
                                *it = 'S'; ++it;
                                *it = 'P'; ++it;
                        } else {
                                *it = char(c); ++it;
                        }
                }

                ctx.advance_to(it);
                return it;
        }
};

// Formats OSC fields as a list of quoted, escaped strings.
template<>
struct formatter<copa::parser::OscFields> {
public:
        constexpr auto parse(format_parse_context& ctx) -> format_parse_context::iterator
        {
                auto it = ctx.begin();
                if (it != ctx.end() && *it != '}')
                        throw format_error{"Invalid format string"};
                return it;
        }

        auto format(copa::parser::OscFields const& fields,
                    format_context& ctx) const -> format_context::iterator
        {
                auto&& it = ctx.out();

                *it = '['; ++it;
                auto first = true;
                for (auto const& field : fields) {
                        if (!first) {
                                *it = ','; ++it;
                                *it = ' '; ++it;
                        }
                        first = false;
                        it = fmt::format_to(it, "{:?}", field);
                }
                *it = ']'; ++it;

                ctx.advance_to(it);
                return it;
        }
};

FMT_END_NAMESPACE
