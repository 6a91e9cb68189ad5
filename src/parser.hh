/*
 * Copyright © 2015 David Herrmann <dh.herrmann@gmail.com>
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

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "parser-collector.hh"
#include "parser-performer.hh"
#include "parser-string.hh"
#include "parser-table.hh"
#include "utf8.hh"

namespace copa::parser {

/*
 * Parser:
 *
 * A byte stream parser for control sequences, based on the state
 * diagram of the DEC VT500 by Paul Williams (https://vt100.net/emu/),
 * extended to decode UTF-8 in ground state.
 *
 * The parser reports everything it recognises to a Performer. It
 * never fails: invalid UTF-8 is replaced by U+FFFD, and malformed
 * sequences are consumed without dispatch (or dispatched with the
 * ignore flag set, for parameter and intermediate overflow).
 *
 * Input may be split into arbitrary chunks; the callbacks do not
 * depend on where the chunk boundaries fall.
 *
 * A Parser may be copied to clone its state for another stream,
 * but one instance must not be shared between streams.
 */
class Parser {
public:
        // Maximum number of input bytes the ground fast path handles at once
        static inline constexpr auto const k_fast_path_chunk = size_t{1024};

        Parser() noexcept;
        ~Parser() noexcept = default;

        Parser(Parser const&) = default;
        Parser(Parser&&) = delete;
        Parser& operator=(Parser const&) = delete;
        Parser& operator=(Parser&&) = delete;

        /*
         * advance:
         * @performer: the #Performer to call
         * @bytes: the input
         *
         * Parses @bytes, calling @performer for every recognised action.
         * Exceptions thrown by @performer propagate.
         */
        void advance(Performer& performer,
                     std::span<uint8_t const> bytes);

        inline void advance(Performer& performer,
                            std::string_view str)
        {
                advance(performer, {reinterpret_cast<uint8_t const*>(str.data()), str.size()});
        }

        /*
         * advance_until_terminated:
         * @performer: the #Performer to call
         * @bytes: the input
         *
         * Like advance(), but stops as soon as @performer's terminated()
         * returns %true. That is checked before each input byte, and after
         * each character dispatched by the fast path.
         *
         * Returns: the number of bytes of @bytes that were consumed
         */
        size_t advance_until_terminated(Performer& performer,
                                        std::span<uint8_t const> bytes);

        inline size_t advance_until_terminated(Performer& performer,
                                               std::string_view str)
        {
                return advance_until_terminated(performer,
                                                {reinterpret_cast<uint8_t const*>(str.data()), str.size()});
        }

        /*
         * reset:
         *
         * Returns to ground state, discarding any partial sequence,
         * string or UTF-8 character, without calling the performer.
         */
        void reset() noexcept;

        inline constexpr State state() const noexcept { return m_state; }

        /*
         * set_fast_path:
         * @enable:
         *
         * Enables or disables the vectorised parsing of text in ground
         * state. This does not change the callbacks made in any way.
         */
        inline constexpr void set_fast_path(bool enable) noexcept { m_fast_path = enable; }
        inline constexpr bool fast_path() const noexcept { return m_fast_path; }

        inline constexpr Collector const& collector() const noexcept { return m_collector; }

private:
        State m_state{State::GROUND};
        Collector m_collector{};
        OscPayload m_osc{};
        base::UTF8Decoder m_utf8{};
        uint8_t m_string_kind{0};
        bool m_fast_path{true};

        template<bool check_terminated>
        size_t advance_impl(Performer& performer,
                            std::span<uint8_t const> bytes);

        template<bool check_terminated>
        size_t advance_ground(Performer& performer,
                              uint8_t const* data,
                              size_t len);

        bool feed(Performer& performer,
                  uint8_t raw);

        bool perform(Performer& performer,
                     Action action,
                     uint8_t raw);

        bool feed_utf8(Performer& performer,
                       uint8_t raw);

        void osc_end(Performer& performer,
                     uint8_t raw);

        void string_start(Performer& performer,
                          uint8_t raw);
        void string_put(Performer& performer,
                        uint8_t raw);
        void string_end(Performer& performer);

        inline void dispatch(Performer& performer,
                             char32_t c)
        {
                if (c < 0x20 || (c >= 0x80 && c < 0xa0)) [[unlikely]]
                        performer.execute(uint8_t(c));
                else
                        performer.print(c);
        }

}; // class Parser

} // namespace copa::parser
