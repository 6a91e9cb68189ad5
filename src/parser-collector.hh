/*
 * Copyright © 2026 the copa authors
 *
 * This library is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <string_view>

#include <glib.h>

#include "debug.hh"
#include "parser-arg.hh"

#define COPA_PARSER_ARG_MAX (32)
#define COPA_PARSER_INTERMEDIATES_MAX (2)

namespace copa::parser {

/*
 * Params:
 *
 * The parameters of a CSI or DCS sequence, in the order they were
 * received. Each slot records its value, whether a value was given
 * at all, and whether it is followed by a subparameter (':').
 *
 * Iterating a Params yields the parameter groups, i.e. a parameter
 * together with its subparameters, as spans of Arg.
 */
class Params {
public:
        static inline constexpr auto const k_max = unsigned{COPA_PARSER_ARG_MAX};

        using group_type = std::span<Arg const>;

        class const_iterator {
        public:
                using iterator_category = std::forward_iterator_tag;
                using value_type = group_type;
                using difference_type = std::ptrdiff_t;
                using pointer = void;
                using reference = group_type;

                constexpr const_iterator() noexcept = default;
                constexpr const_iterator(Params const* params,
                                         unsigned pos) noexcept
                        : m_params{params},
                          m_pos{pos}
                {
                }

                inline constexpr group_type operator*() const noexcept
                {
                        return {m_params->m_args.data() + m_pos, m_params->group_length(m_pos)};
                }

                inline constexpr const_iterator& operator++() noexcept
                {
                        m_pos += m_params->group_length(m_pos);
                        return *this;
                }

                inline constexpr const_iterator operator++(int) noexcept
                {
                        auto tmp = *this;
                        ++*this;
                        return tmp;
                }

                friend constexpr bool operator==(const_iterator const&, const_iterator const&) = default;

        private:
                Params const* m_params{nullptr};
                unsigned m_pos{0};
        }; // class const_iterator

        constexpr Params() noexcept = default;

        inline constexpr unsigned size() const noexcept { return m_n_args; }
        inline constexpr bool empty() const noexcept { return m_n_args == 0; }
        inline constexpr bool full() const noexcept { return m_n_args == k_max; }

        inline constexpr const_iterator begin() const noexcept { return {this, 0}; }
        inline constexpr const_iterator end() const noexcept { return {this, m_n_args}; }

        /*
         * arg:
         * @idx: the slot index
         *
         * Returns: the arg in slot @idx, or a default arg if @idx is out of range
         */
        inline constexpr Arg arg(unsigned idx) const noexcept
        {
                return idx < m_n_args ? m_args[idx] : Arg{};
        }

        /*
         * param:
         * @idx: the slot index
         * @default_v: the value to use for an empty slot (defaults to 0)
         *
         * Returns: the value of the parameter in slot @idx, or @default_v
         *   if the slot is empty or @idx is out of range
         */
        inline constexpr int param(unsigned idx,
                                   int default_v = 0) const noexcept
        {
                return arg(idx).value(default_v);
        }

        // Returns: whether the slot @idx has default value
        inline constexpr bool param_default(unsigned idx) const noexcept
        {
                return arg(idx).is_default();
        }

        // Returns: whether the slot @idx is followed by a subparameter
        inline constexpr bool param_nonfinal(unsigned idx) const noexcept
        {
                return arg(idx).nonfinal();
        }

        // Returns: whether the slot @idx is a subparameter of the slot before it
        inline constexpr bool param_subparam(unsigned idx) const noexcept
        {
                return idx > 0 && idx < m_n_args && m_args[idx - 1].nonfinal();
        }

        /*
         * next:
         * @idx: the slot index
         *
         * Returns: the index of the first slot of the group after the one
         *   containing @idx
         */
        inline constexpr unsigned next(unsigned idx) const noexcept
        {
                while (idx < m_n_args && m_args[idx].nonfinal())
                        ++idx;
                return idx + 1;
        }

        inline constexpr unsigned n_groups() const noexcept
        {
                auto n = 0u;
                for (auto idx = 0u; idx < m_n_args; idx = next(idx))
                        ++n;
                return n;
        }

        /*
         * push:
         * @arg: a finished arg
         *
         * Appends @arg. The caller must check full() first.
         */
        inline constexpr void push(Arg arg) noexcept
        {
                g_assert(m_n_args < k_max);
                m_args[m_n_args++] = arg;
        }

        inline constexpr void clear() noexcept
        {
                m_n_args = 0;
        }

private:
        std::array<Arg, k_max> m_args{};
        unsigned m_n_args{0};

        inline constexpr unsigned group_length(unsigned pos) const noexcept
        {
                return std::min(next(pos), m_n_args) - pos;
        }

}; // class Params

/*
 * Intermediates:
 *
 * The intermediate bytes 2/0..2/15 of an ESC, CSI or DCS sequence,
 * and the private parameter byte 3/12..3/15 of a CSI or DCS sequence.
 */
class Intermediates {
public:
        static inline constexpr auto const k_max = unsigned{COPA_PARSER_INTERMEDIATES_MAX};

        constexpr Intermediates() noexcept = default;

        inline constexpr unsigned size() const noexcept { return m_n; }
        inline constexpr bool empty() const noexcept { return m_n == 0; }

        inline constexpr uint8_t operator[](unsigned idx) const noexcept
        {
                return idx < m_n ? m_bytes[idx] : 0;
        }

        inline constexpr auto begin() const noexcept { return m_bytes.begin(); }
        inline constexpr auto end() const noexcept { return m_bytes.begin() + m_n; }

        inline constexpr std::span<uint8_t const> bytes() const noexcept
        {
                return {m_bytes.data(), m_n};
        }

        inline std::string_view string_view() const noexcept
        {
                return {reinterpret_cast<char const*>(m_bytes.data()), m_n};
        }

        // Returns: true if @c was stored, false if already full
        inline constexpr bool push(uint8_t c) noexcept
        {
                if (m_n == k_max) [[unlikely]]
                        return false;

                m_bytes[m_n++] = c;
                return true;
        }

        inline constexpr void clear() noexcept { m_n = 0; }

        friend constexpr bool operator==(Intermediates const& lhs,
                                         Intermediates const& rhs) noexcept
        {
                return std::ranges::equal(lhs.bytes(), rhs.bytes());
        }

private:
        std::array<uint8_t, k_max> m_bytes{};
        unsigned m_n{0};

}; // class Intermediates

/*
 * Collector:
 *
 * Accumulates the parameters and intermediates of the sequence
 * currently being parsed. Overflowing either never fails; the
 * excess is dropped and the ignore flag is raised instead.
 */
class Collector {
public:
        constexpr Collector() noexcept = default;

        inline constexpr Params const& params() const noexcept { return m_params; }
        inline constexpr Intermediates const& intermediates() const noexcept { return m_intermediates; }
        inline constexpr bool ignore() const noexcept { return m_ignore; }

        // Returns: the parameter currently being accumulated
        inline constexpr Arg current() const noexcept { return m_current; }

        inline constexpr void clear() noexcept
        {
                m_params.clear();
                m_intermediates.clear();
                m_current = Arg{};
                m_ignore = false;
        }

        /*
         * push_param_digit:
         * @c: a value between 3/0 and 3/9 ['0' .. '9']
         */
        inline void push_param_digit(uint8_t c) noexcept
        {
                if (m_params.full()) [[unlikely]]
                        return overflow("digit");

                m_current.push(c);
        }

        /*
         * push_param_separator:
         * @is_subparam: true for ':', false for ';'
         *
         * Terminates the current parameter. With @is_subparam, the
         * next parameter is a subparameter of the current one.
         */
        inline void push_param_separator(bool is_subparam) noexcept
        {
                if (m_params.full()) [[unlikely]]
                        return overflow(is_subparam ? "subparameter" : "parameter");

                m_current.finish(is_subparam);
                m_params.push(m_current);
                m_current = Arg{};
        }

        /*
         * push_intermediate:
         * @c: a value between 2/0 and 2/15, or 3/12 and 3/15
         */
        inline void push_intermediate(uint8_t c) noexcept
        {
                if (!m_intermediates.push(c)) [[unlikely]]
                        overflow("intermediate");
        }

        /*
         * finish:
         *
         * Terminates the last parameter when the final byte arrives.
         * There is always a last parameter, so a sequence without
         * parameters has a single default one.
         */
        inline void finish() noexcept
        {
                if (m_params.full()) [[unlikely]]
                        return overflow("final parameter");

                m_current.finish(false);
                m_params.push(m_current);
                m_current = Arg{};
        }

private:
        Params m_params{};
        Intermediates m_intermediates{};
        Arg m_current{};
        bool m_ignore{false};

        inline void overflow(char const* what) noexcept
        {
                _copa_debug_print(copa::debug::category::PARAMS,
                                  "Overflow on {}, ignoring sequence", what);
                m_ignore = true;
        }

}; // class Collector

} // namespace copa::parser
