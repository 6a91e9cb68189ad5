/*
 * Copyright © 2017, 2018 Christian Persch
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

#include <cstdint>

namespace copa::parser {

/*
 * Arg:
 *
 * A CSI or DCS parameter slot.
 *
 * Parameters can be final or nonfinal. Final parameters are those
 * that occur at the end of the parameter list, or the end of a
 * subparameter list. Nonfinal parameters are those that have
 * subparameters after them, i.e. that were terminated by ':'.
 *
 * Parameters have default value (no digits were seen) or have a
 * nondefault value. Values saturate at 65535.
 */
class Arg {
public:
        static inline constexpr int const k_flag_value    = 1 << 16;
        static inline constexpr int const k_flag_nonfinal = 1 << 17;
        static inline constexpr int const k_flag_mask     = k_flag_value | k_flag_nonfinal;
        static inline constexpr int const k_value_mask    = 0xffff;
        static inline constexpr int const k_value_max     = 0xffff;

        constexpr Arg() noexcept = default;

        /*
         * Arg:
         * @value: the value, or -1 for a parameter with default value
         */
        explicit constexpr Arg(int value) noexcept
                : m_arg{value == -1 ? 0 : ((value & k_value_mask) | k_flag_value)}
        {
        }

        /*
         * push:
         * @c: a value between 3/0 and 3/9 ['0' .. '9']
         *
         * Multiplies the value by 10 and adds the numeric value of @c,
         * saturating at 65535.
         *
         * After this, the arg has a nondefault value.
         */
        inline constexpr void push(uint8_t c) noexcept
        {
                auto value = (m_arg & k_value_mask) * 10 + (c - '0');
                if (value > k_value_max)
                        value = k_value_max;

                m_arg = (m_arg & k_flag_nonfinal) | value | k_flag_value;
        }

        /*
         * finish:
         * @nonfinal: whether there are more subparameters after this one
         *
         * Finishes the arg; after this no more push() calls are allowed.
         */
        inline constexpr void finish(bool nonfinal = false) noexcept
        {
                if (nonfinal)
                        m_arg |= k_flag_nonfinal;
                else
                        m_arg &= ~k_flag_nonfinal;
        }

        // Returns: whether the arg has a nondefault value
        inline constexpr bool started() const noexcept { return m_arg & k_flag_value; }

        // Returns: whether the arg has default value
        inline constexpr bool is_default() const noexcept { return !started(); }

        // Returns: whether there are more subparameters after this arg
        inline constexpr bool nonfinal() const noexcept { return m_arg & k_flag_nonfinal; }

        /*
         * value:
         * @default_v: (defaults to 0)
         *
         * Returns: the value of the arg, or @default_v if the arg has default value
         */
        inline constexpr int value(int default_v = 0) const noexcept
        {
                return started() ? (m_arg & k_value_mask) : default_v;
        }

        /*
         * value_final:
         * @default_v: (defaults to -1)
         *
         * Returns: the value of the arg, or @default_v if the arg has
         *   default value or is nonfinal
         */
        inline constexpr int value_final(int default_v = -1) const noexcept
        {
                return ((m_arg & k_flag_mask) == k_flag_value) ? (m_arg & k_value_mask) : default_v;
        }

        // Returns: the raw value of the arg, 0 for a default arg
        inline constexpr uint16_t raw() const noexcept { return uint16_t(m_arg & k_value_mask); }

        inline constexpr int encoded() const noexcept { return m_arg; }

        static inline constexpr Arg from_encoded(int v) noexcept
        {
                auto arg = Arg{};
                arg.m_arg = v & (k_flag_mask | k_value_mask);
                return arg;
        }

        friend constexpr bool operator==(Arg const&, Arg const&) = default;

private:
        int m_arg{0};

}; // class Arg

} // namespace copa::parser
