/*
 * Copyright (C) 2002,2003 Red Hat, Inc.
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

#include "debug.hh"

#include <algorithm>
#include <iterator>

#include <glib.h>

#if COPA_DEBUG
#include <fmt/format.h>
#endif

#if COPA_DEBUG
static unsigned
parse_debug_flags(void)
{
        using enum copa::debug::category;
        GDebugKey const keys[] = {
                { "misc",         unsigned(MISC         )},
                { "parser",       unsigned(PARSER       )},
                { "io",           unsigned(IO           )},
                { "utf8",         unsigned(UTF8         )},
                { "params",       unsigned(PARAMS       )},
                { "osc",          unsigned(OSC          )},
                { "exceptions",   unsigned(EXCEPTIONS   )},
        };

        auto flags = g_parse_debug_string(g_getenv("COPA_DEBUG"),
                                          keys,
                                          G_N_ELEMENTS(keys));
        copa::debug::debug_categories = copa::debug::category(flags);

        _copa_debug_print(copa::debug::category::ALL,
                          "copa debug flags {:x}",
                          flags);
        return flags;
}
#endif /* COPA_DEBUG */

/*
 * _copa_debug_init:
 *
 * Reads the COPA_DEBUG environment variable. Only the first call
 * has any effect; every Parser calls this on construction.
 */
void
_copa_debug_init(void)
{
#if COPA_DEBUG
        [[maybe_unused]] static auto const flags = parse_debug_flags();
#endif
}

#if COPA_DEBUG
static void
hexdump_line(fmt::memory_buffer& out,
             size_t ofs,
             uint8_t const* buf,
             size_t len)
{
        auto it = std::back_inserter(out);
        it = fmt::format_to(it, "{:08x}  ", ofs);
        for (auto i = 0u; i < 16; ++i) {
                if (i < len)
                        it = fmt::format_to(it, "{:02x} ", buf[i]);
                else
                        it = fmt::format_to(it, "   ");
                if (i == 7)
                        *it++ = ' ';
        }

        it = fmt::format_to(it, "  |");
        for (auto i = 0u; i < 16; ++i) {
                *it++ = i < len ? (g_ascii_isprint(buf[i]) ? char(buf[i]) : '.') : ' ';
        }
        fmt::format_to(it, "|\n");
}
#endif /* COPA_DEBUG */

void
_copa_debug_hexdump(char const* str,
                    uint8_t const* buf,
                    size_t len)
{
#if COPA_DEBUG
        auto out = fmt::memory_buffer{};
        fmt::format_to(std::back_inserter(out), "{} len = {:#x} = {}\n", str, len, len);

        for (auto ofs = size_t{0}; ofs < len; ofs += 16)
                hexdump_line(out, ofs, buf + ofs, std::min(len - ofs, size_t{16}));

        copa::debug::println("{}", fmt::to_string(out));
#endif /* COPA_DEBUG */
}
