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

#include "parser-table.hh"

namespace copa::parser {

namespace {

using enum State;
using enum Action;

class TableBuilder {
public:
        constexpr TableBuilder() noexcept
        {
                for (auto s = 0u; s < k_n_states; ++s)
                        for (auto c = 0u; c < 256u; ++c)
                                m_table[s][c] = Transition{State(s), IGNORE};
        }

        constexpr TableBuilder& state(State s) noexcept
        {
                m_state = s;
                return *this;
        }

        // Sets the transition for bytes @first .. @last inclusive
        constexpr TableBuilder& on(unsigned first,
                                   unsigned last,
                                   State next,
                                   Action action) noexcept
        {
                for (auto c = first; c <= last; ++c)
                        m_table[std::to_underlying(m_state)][c] = Transition{next, action};
                return *this;
        }

        constexpr TableBuilder& on(unsigned c,
                                   State next,
                                   Action action) noexcept
        {
                return on(c, c, next, action);
        }

        // Sets the transition for bytes @first .. @last inclusive,
        // staying in the current state
        constexpr TableBuilder& on(unsigned first,
                                   unsigned last,
                                   Action action) noexcept
        {
                return on(first, last, m_state, action);
        }

        constexpr TableBuilder& on(unsigned c,
                                   Action action) noexcept
        {
                return on(c, c, m_state, action);
        }

        // C0 controls other than CAN, SUB and ESC
        constexpr TableBuilder& on_c0(Action action) noexcept
        {
                return on(0x00, 0x17, action).on(0x19, action).on(0x1c, 0x1f, action);
        }

        // CAN, SUB and ESC, which have the same effect in every state
        constexpr TableBuilder& anywhere() noexcept
        {
                return on(0x18, GROUND, EXECUTE).on(0x1a, GROUND, EXECUTE).on(0x1b, ESCAPE, NONE);
        }

        constexpr TransitionTable const& table() const noexcept { return m_table; }

private:
        TransitionTable m_table{};
        State m_state{GROUND};

}; // class TableBuilder

constexpr TransitionTable
build_table() noexcept
{
        auto b = TableBuilder{};

        b.state(GROUND)
                .on_c0(EXECUTE)
                .anywhere()
                .on(0x20, 0x7f, PRINT)
                .on(0x80, 0xff, UTF8);

        b.state(ESCAPE)
                .on_c0(EXECUTE)
                .anywhere()
                .on(0x20, 0x2f, ESCAPE_INTERMEDIATE, COLLECT)
                .on(0x30, 0x7e, GROUND, ESC_DISPATCH)
                .on('P', DCS_ENTRY, NONE)
                .on('X', SOS_PM_APC_STRING, NONE)
                .on('[', CSI_ENTRY, NONE)
                .on(']', OSC_STRING, NONE)
                .on('^', SOS_PM_APC_STRING, NONE)
                .on('_', SOS_PM_APC_STRING, NONE);

        b.state(ESCAPE_INTERMEDIATE)
                .on_c0(EXECUTE)
                .anywhere()
                .on(0x20, 0x2f, COLLECT)
                .on(0x30, 0x7e, GROUND, ESC_DISPATCH);

        b.state(CSI_ENTRY)
                .on_c0(EXECUTE)
                .anywhere()
                .on(0x20, 0x2f, CSI_INTERMEDIATE, COLLECT)
                .on(0x30, 0x39, CSI_PARAM, PARAM)
                .on(0x3a, CSI_PARAM, SUBPARAM_SEPARATOR)
                .on(0x3b, CSI_PARAM, PARAM_SEPARATOR)
                .on(0x3c, 0x3f, CSI_PARAM, COLLECT)
                .on(0x40, 0x7e, GROUND, CSI_DISPATCH);

        b.state(CSI_PARAM)
                .on_c0(EXECUTE)
                .anywhere()
                .on(0x20, 0x2f, CSI_INTERMEDIATE, COLLECT)
                .on(0x30, 0x39, PARAM)
                .on(0x3a, SUBPARAM_SEPARATOR)
                .on(0x3b, PARAM_SEPARATOR)
                .on(0x3c, 0x3f, CSI_IGNORE, NONE)
                .on(0x40, 0x7e, GROUND, CSI_DISPATCH);

        b.state(CSI_INTERMEDIATE)
                .on_c0(EXECUTE)
                .anywhere()
                .on(0x20, 0x2f, COLLECT)
                .on(0x30, 0x3f, CSI_IGNORE, NONE)
                .on(0x40, 0x7e, GROUND, CSI_DISPATCH);

        b.state(CSI_IGNORE)
                .on_c0(EXECUTE)
                .anywhere()
                .on(0x40, 0x7e, GROUND, NONE);

        b.state(DCS_ENTRY)
                .anywhere()
                .on(0x20, 0x2f, DCS_INTERMEDIATE, COLLECT)
                .on(0x30, 0x39, DCS_PARAM, PARAM)
                .on(0x3a, DCS_PARAM, SUBPARAM_SEPARATOR)
                .on(0x3b, DCS_PARAM, PARAM_SEPARATOR)
                .on(0x3c, 0x3f, DCS_PARAM, COLLECT)
                .on(0x40, 0x7e, DCS_PASSTHROUGH, HOOK);

        b.state(DCS_PARAM)
                .anywhere()
                .on(0x20, 0x2f, DCS_INTERMEDIATE, COLLECT)
                .on(0x30, 0x39, PARAM)
                .on(0x3a, SUBPARAM_SEPARATOR)
                .on(0x3b, PARAM_SEPARATOR)
                .on(0x3c, 0x3f, DCS_IGNORE, NONE)
                .on(0x40, 0x7e, DCS_PASSTHROUGH, HOOK);

        b.state(DCS_INTERMEDIATE)
                .anywhere()
                .on(0x20, 0x2f, COLLECT)
                .on(0x30, 0x3f, DCS_IGNORE, NONE)
                .on(0x40, 0x7e, DCS_PASSTHROUGH, HOOK);

        b.state(DCS_PASSTHROUGH)
                .on_c0(PUT)
                .anywhere()
                .on(0x20, 0x7e, PUT)
                .on(0x9c, GROUND, NONE);

        b.state(DCS_IGNORE)
                .anywhere()
                .on(0x9c, GROUND, NONE);

        b.state(OSC_STRING)
                .anywhere()
                .on(0x07, GROUND, NONE)
                .on(0x20, 0xff, OSC_PUT);

        b.state(SOS_PM_APC_STRING)
                .anywhere()
                .on(0x07, GROUND, NONE)
                .on(0x20, 0xff, STRING_PUT);

        // The decoder decides; CAN, SUB and ESC only take effect
        // after the pending sequence was flushed.
        b.state(UTF8_CONTINUATION)
                .on(0x00, 0xff, UTF8);

        return b.table();
}

} // anon namespace

constinit TransitionTable const k_transitions = build_table();

static_assert(build_table()[std::to_underlying(GROUND)][0x1b].state == ESCAPE);
static_assert(build_table()[std::to_underlying(ESCAPE)][0x1b].action == NONE);
static_assert(build_table()[std::to_underlying(DCS_PASSTHROUGH)][0x7f].action == IGNORE);
static_assert(build_table()[std::to_underlying(OSC_STRING)][0x9c].action == OSC_PUT);

} // namespace copa::parser
