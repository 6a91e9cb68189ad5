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

#include "config.h"

#include "utf8.hh"

namespace copa::base {

/* For each possible first byte, the number of continuation bytes
 * that must follow, the accepted range of the first continuation
 * byte, and the mask of payload bits in the first byte.
 *
 * Byte        │ needed  lower   upper
 * ────────────┼───────────────────────
 * 0x00..0x7f  │ 0
 * 0x80..0xc1  │ invalid
 * 0xc2..0xdf  │ 1       0x80    0xbf
 * 0xe0        │ 2       0xa0    0xbf    (no overlongs)
 * 0xe1..0xec  │ 2       0x80    0xbf
 * 0xed        │ 2       0x80    0x9f    (no surrogates)
 * 0xee..0xef  │ 2       0x80    0xbf
 * 0xf0        │ 3       0x90    0xbf    (no overlongs)
 * 0xf1..0xf3  │ 3       0x80    0xbf
 * 0xf4        │ 3       0x80    0x8f    (nothing above U+10FFFF)
 * 0xf5..0xff  │ invalid
 */
constinit std::array<UTF8Decoder::Lead, 256> const UTF8Decoder::kLeadTable = [] {
        auto table = std::array<Lead, 256>{};
        for (auto b = 0u; b < 256; ++b) {
                auto& e = table[b];
                e.lower = 0x80;
                e.upper = 0xbf;

                if (b < 0x80) {
                        e.needed = 0;
                        e.mask = 0x7f;
                } else if (b < 0xc2) {
                        e.needed = kInvalid;
                } else if (b < 0xe0) {
                        e.needed = 1;
                        e.mask = 0x1f;
                } else if (b < 0xf0) {
                        e.needed = 2;
                        e.mask = 0x0f;
                        if (b == 0xe0)
                                e.lower = 0xa0;
                        else if (b == 0xed)
                                e.upper = 0x9f;
                } else if (b < 0xf5) {
                        e.needed = 3;
                        e.mask = 0x07;
                        if (b == 0xf0)
                                e.lower = 0x90;
                        else if (b == 0xf4)
                                e.upper = 0x8f;
                } else {
                        e.needed = kInvalid;
                }
        }

        return table;
}();

} // namespace copa::base
