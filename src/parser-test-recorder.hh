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

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glib.h>

#include <fmt/format.h>

#include "parser-fmt.hh"
#include "parser-performer.hh"

namespace copa::parser::test {

/*
 * Recorder:
 *
 * A performer that records its callbacks as a list of strings,
 * merging runs of print, put and string put callbacks into one
 * entry each:
 *
 *   print:TEXT            the printed characters, as UTF-8
 *   execute:0xNN
 *   csi:PARAMS:INTERMEDIATES:F   ("csi!" if ignore was set)
 *   esc:INTERMEDIATES:F          ("esc!" if ignore was set)
 *   hook:PARAMS:INTERMEDIATES:F  ("hook!" if ignore was set)
 *   put:BYTES
 *   unhook
 *   osc:FIELD|FIELD|...:bel      (":st" if not BEL terminated)
 *   sos_start, sos_put:BYTES, sos_end, and likewise for pm and apc
 */
class Recorder final : public Performer {
public:
        std::vector<std::string> events{};

        // The arguments of the last csi_dispatch or hook
        Params params{};
        Intermediates intermediates{};

        // The fields of the last osc_dispatch
        std::vector<std::string> osc_fields{};

        // Number of callbacks received
        size_t n_callbacks{0};

        // terminated() returns true once this many callbacks were received
        size_t stop_after{size_t(-1)};

        void print(char32_t c) override
        {
                char ubuf[8];
                auto const len = g_unichar_to_utf8(c, ubuf);
                merge("print:", {ubuf, size_t(len)});
        }

        void execute(uint8_t control) override
        {
                add(fmt::format("execute:{:#04x}", control));
        }

        void csi_dispatch(Params const& p,
                          Intermediates const& i,
                          bool ignore,
                          char final) override
        {
                params = p;
                intermediates = i;
                add(fmt::format("csi{}:{}:{}:{}", ignore ? "!" : "", p, i.string_view(), final));
        }

        void esc_dispatch(Intermediates const& i,
                          bool ignore,
                          char final) override
        {
                intermediates = i;
                add(fmt::format("esc{}:{}:{}", ignore ? "!" : "", i.string_view(), final));
        }

        void hook(Params const& p,
                  Intermediates const& i,
                  bool ignore,
                  char final) override
        {
                params = p;
                intermediates = i;
                add(fmt::format("hook{}:{}:{}:{}", ignore ? "!" : "", p, i.string_view(), final));
        }

        void put(uint8_t byte) override { merge("put:", byte); }
        void unhook() override { add("unhook"); }

        void osc_dispatch(OscFields const& fields,
                          bool bell_terminated) override
        {
                osc_fields.clear();
                auto str = std::string{"osc:"};
                auto first = true;
                for (auto const& field : fields) {
                        if (!first)
                                str.push_back('|');
                        first = false;
                        str.append(field);
                        osc_fields.emplace_back(field);
                }
                str.append(bell_terminated ? ":bel" : ":st");
                add(std::move(str));
        }

        void sos_start() override { add("sos_start"); }
        void sos_put(uint8_t byte) override { merge("sos_put:", byte); }
        void sos_end() override { add("sos_end"); }

        void pm_start() override { add("pm_start"); }
        void pm_put(uint8_t byte) override { merge("pm_put:", byte); }
        void pm_end() override { add("pm_end"); }

        void apc_start() override { add("apc_start"); }
        void apc_put(uint8_t byte) override { merge("apc_put:", byte); }
        void apc_end() override { add("apc_end"); }

        bool terminated() const override
        {
                return n_callbacks >= stop_after;
        }

        void clear()
        {
                events.clear();
                osc_fields.clear();
                n_callbacks = 0;
        }

private:
        using string_view = std::string_view;

        void add(std::string event)
        {
                ++n_callbacks;
                events.push_back(std::move(event));
        }

        void merge(string_view prefix,
                   string_view data)
        {
                ++n_callbacks;
                if (!events.empty() && events.back().starts_with(prefix)) {
                        events.back().append(data);
                        return;
                }

                auto event = std::string{prefix};
                event.append(data);
                events.push_back(std::move(event));
        }

        void merge(string_view prefix,
                   uint8_t byte)
        {
                auto const c = char(byte);
                merge(prefix, string_view{&c, 1});
        }

}; // class Recorder

} // namespace copa::parser::test
