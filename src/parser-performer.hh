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

#include <cstdint>

#include "parser-collector.hh"
#include "parser-string.hh"

namespace copa::parser {

/*
 * Performer:
 *
 * Receives the actions recognised by a Parser. Every callback
 * has an empty default implementation, so a performer only needs
 * to override what it is interested in.
 *
 * The Params, Intermediates and OscFields references handed to the
 * callbacks point into the parser, and are only valid for the
 * duration of the call.
 */
class Performer {
public:
        virtual ~Performer() = default;

        /*
         * print:
         * @c: a Unicode scalar value, or U+FFFD for invalid input
         */
        virtual void print(char32_t c) { }

        /*
         * execute:
         * @control: a C0 control, DEL excluded, or a C1 control
         */
        virtual void execute(uint8_t control) { }

        /*
         * csi_dispatch:
         * @params: the parameters
         * @intermediates: the intermediates and private marker
         * @ignore: whether parameters or intermediates overflowed
         * @final: the final byte
         */
        virtual void csi_dispatch(Params const& params,
                                  Intermediates const& intermediates,
                                  bool ignore,
                                  char final) { }

        /*
         * esc_dispatch:
         * @intermediates: the intermediates
         * @ignore: whether intermediates overflowed
         * @final: the final byte
         */
        virtual void esc_dispatch(Intermediates const& intermediates,
                                  bool ignore,
                                  char final) { }

        /*
         * hook:
         *
         * A DCS sequence started. Its data follows through put(),
         * and unhook() ends it.
         */
        virtual void hook(Params const& params,
                          Intermediates const& intermediates,
                          bool ignore,
                          char final) { }

        virtual void put(uint8_t byte) { }

        virtual void unhook() { }

        /*
         * osc_dispatch:
         * @fields: the ';'-separated fields of the payload
         * @bell_terminated: whether the string ended with BEL instead of ST
         */
        virtual void osc_dispatch(OscFields const& fields,
                                  bool bell_terminated) { }

        virtual void sos_start() { }
        virtual void sos_put(uint8_t byte) { }
        virtual void sos_end() { }

        virtual void pm_start() { }
        virtual void pm_put(uint8_t byte) { }
        virtual void pm_end() { }

        virtual void apc_start() { }
        virtual void apc_put(uint8_t byte) { }
        virtual void apc_end() { }

        /*
         * terminated:
         *
         * Checked by Parser::advance_until_terminated() before each byte,
         * so this should be cheap.
         *
         * Returns: %true to stop parsing
         */
        virtual bool terminated() const { return false; }

}; // class Performer

} // namespace copa::parser
