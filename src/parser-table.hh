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

#include <array>
#include <cstdint>
#include <utility>

namespace copa::parser {

/*
 * State Machine
 *
 * The parser states, following the state diagram of the DEC VT500
 * by Paul Williams (https://vt100.net/emu/dec_ansi_parser), extended
 * with a state for pending UTF-8 continuation bytes in ground.
 */
enum class State : uint8_t {
        GROUND,              /* initial state and ground */
        ESCAPE,              /* ESC sequence was started */
        ESCAPE_INTERMEDIATE, /* intermediate escape characters */
        CSI_ENTRY,           /* starting CSI sequence */
        CSI_PARAM,           /* CSI parameters */
        CSI_INTERMEDIATE,    /* intermediate CSI characters */
        CSI_IGNORE,          /* CSI error; ignore this CSI sequence */
        DCS_ENTRY,           /* starting DCS sequence */
        DCS_PARAM,           /* DCS parameters */
        DCS_INTERMEDIATE,    /* intermediate DCS characters */
        DCS_PASSTHROUGH,     /* DCS data passthrough */
        DCS_IGNORE,          /* DCS error; ignore until ST */
        OSC_STRING,          /* parsing OSC sequence */
        SOS_PM_APC_STRING,   /* parsing SOS, PM or APC string */
        UTF8_CONTINUATION,   /* UTF-8 sequence pending in ground */
};

inline constexpr auto const k_n_states = std::to_underlying(State::UTF8_CONTINUATION) + 1u;

enum class Action : uint8_t {
        NONE,                /* no action beyond the state change */
        IGNORE,              /* byte is dropped */
        PRINT,               /* print a graphic character */
        EXECUTE,             /* execute a C0 or C1 control */
        CLEAR,               /* clear parameters and intermediates */
        COLLECT,             /* collect an intermediate or private marker */
        PARAM,               /* accumulate a parameter digit */
        PARAM_SEPARATOR,     /* ';' */
        SUBPARAM_SEPARATOR,  /* ':' */
        ESC_DISPATCH,
        CSI_DISPATCH,
        HOOK,                /* DCS final byte */
        PUT,                 /* DCS data byte */
        UNHOOK,              /* DCS end */
        OSC_START,
        OSC_PUT,
        OSC_END,
        STRING_START,        /* SOS, PM or APC start */
        STRING_PUT,
        STRING_END,
        UTF8,                /* feed the UTF-8 decoder */
};

inline constexpr auto const k_n_actions = std::to_underlying(Action::UTF8) + 1u;

struct Transition {
        State state;
        Action action;
};

using TransitionTable = std::array<std::array<Transition, 256>, k_n_states>;

/*
 * k_transitions:
 *
 * The transition for every (state, byte) pair. A transition whose
 * state differs from the current one also runs the exit action of the
 * current state before, and the entry action of the new state after,
 * the transition action.
 */
extern TransitionTable const k_transitions;

inline Transition
transition(State state,
           uint8_t byte) noexcept
{
        return k_transitions[std::to_underlying(state)][byte];
}

// Returns: the action to run when entering @state
inline constexpr Action
entry_action(State state) noexcept
{
        switch (state) {
                using enum State;
        case ESCAPE:
        case CSI_ENTRY:
        case DCS_ENTRY:
                return Action::CLEAR;
        case OSC_STRING:
                return Action::OSC_START;
        case SOS_PM_APC_STRING:
                return Action::STRING_START;
        default:
                return Action::NONE;
        }
}

// Returns: the action to run when leaving @state
inline constexpr Action
exit_action(State state) noexcept
{
        switch (state) {
                using enum State;
        case DCS_PASSTHROUGH:
                return Action::UNHOOK;
        case OSC_STRING:
                return Action::OSC_END;
        case SOS_PM_APC_STRING:
                return Action::STRING_END;
        default:
                return Action::NONE;
        }
}

} // namespace copa::parser
