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

#include "config.h"

#include "parser-fmt.hh"

#include <string_view>

using namespace std::literals::string_view_literals;

namespace copa::parser::detail {

auto
state_to_sv(State state) noexcept -> std::string_view
{
        switch (state) {
                using enum State;
        case GROUND: return "GROUND"sv;
        case ESCAPE: return "ESCAPE"sv;
        case ESCAPE_INTERMEDIATE: return "ESCAPE_INTERMEDIATE"sv;
        case CSI_ENTRY: return "CSI_ENTRY"sv;
        case CSI_PARAM: return "CSI_PARAM"sv;
        case CSI_INTERMEDIATE: return "CSI_INTERMEDIATE"sv;
        case CSI_IGNORE: return "CSI_IGNORE"sv;
        case DCS_ENTRY: return "DCS_ENTRY"sv;
        case DCS_PARAM: return "DCS_PARAM"sv;
        case DCS_INTERMEDIATE: return "DCS_INTERMEDIATE"sv;
        case DCS_PASSTHROUGH: return "DCS_PASSTHROUGH"sv;
        case DCS_IGNORE: return "DCS_IGNORE"sv;
        case OSC_STRING: return "OSC_STRING"sv;
        case SOS_PM_APC_STRING: return "SOS_PM_APC_STRING"sv;
        case UTF8_CONTINUATION: return "UTF8_CONTINUATION"sv;
        default: __builtin_unreachable(); return ""sv;
        }
}

auto
action_to_sv(Action action) noexcept -> std::string_view
{
        switch (action) {
                using enum Action;
        case NONE: return "NONE"sv;
        case IGNORE: return "IGNORE"sv;
        case PRINT: return "PRINT"sv;
        case EXECUTE: return "EXECUTE"sv;
        case CLEAR: return "CLEAR"sv;
        case COLLECT: return "COLLECT"sv;
        case PARAM: return "PARAM"sv;
        case PARAM_SEPARATOR: return "PARAM_SEPARATOR"sv;
        case SUBPARAM_SEPARATOR: return "SUBPARAM_SEPARATOR"sv;
        case ESC_DISPATCH: return "ESC_DISPATCH"sv;
        case CSI_DISPATCH: return "CSI_DISPATCH"sv;
        case HOOK: return "HOOK"sv;
        case PUT: return "PUT"sv;
        case UNHOOK: return "UNHOOK"sv;
        case OSC_START: return "OSC_START"sv;
        case OSC_PUT: return "OSC_PUT"sv;
        case OSC_END: return "OSC_END"sv;
        case STRING_START: return "STRING_START"sv;
        case STRING_PUT: return "STRING_PUT"sv;
        case STRING_END: return "STRING_END"sv;
        case UTF8: return "UTF8"sv;
        default: __builtin_unreachable(); return ""sv;
        }
}

auto
control_to_sv(control_t const& ctrl) noexcept -> std::string_view
{
        switch (ctrl.get()) {
        case 0x00: return "NUL"sv;
        case 0x01: return "SOH"sv;
        case 0x02: return "STX"sv;
        case 0x03: return "ETX"sv;
        case 0x04: return "EOT"sv;
        case 0x05: return "ENQ"sv;
        case 0x06: return "ACK"sv;
        case 0x07: return "BEL"sv;
        case 0x08: return "BS"sv;
        case 0x09: return "HT"sv;
        case 0x0a: return "LF"sv;
        case 0x0b: return "VT"sv;
        case 0x0c: return "FF"sv;
        case 0x0d: return "CR"sv;
        case 0x0e: return "SO"sv;
        case 0x0f: return "SI"sv;
        case 0x10: return "DLE"sv;
        case 0x11: return "DC1"sv;
        case 0x12: return "DC2"sv;
        case 0x13: return "DC3"sv;
        case 0x14: return "DC4"sv;
        case 0x15: return "NAK"sv;
        case 0x16: return "SYN"sv;
        case 0x17: return "ETB"sv;
        case 0x18: return "CAN"sv;
        case 0x19: return "EM"sv;
        case 0x1a: return "SUB"sv;
        case 0x1b: return "ESC"sv;
        case 0x1c: return "FS"sv;
        case 0x1d: return "GS"sv;
        case 0x1e: return "RS"sv;
        case 0x1f: return "US"sv;
        case 0x7f: return "DEL"sv;
        case 0x80: return "PAD"sv;
        case 0x81: return "HOP"sv;
        case 0x82: return "BPH"sv;
        case 0x83: return "NBH"sv;
        case 0x84: return "IND"sv;
        case 0x85: return "NEL"sv;
        case 0x86: return "SSA"sv;
        case 0x87: return "ESA"sv;
        case 0x88: return "HTS"sv;
        case 0x89: return "HTJ"sv;
        case 0x8a: return "VTS"sv;
        case 0x8b: return "PLD"sv;
        case 0x8c: return "PLU"sv;
        case 0x8d: return "RI"sv;
        case 0x8e: return "SS2"sv;
        case 0x8f: return "SS3"sv;
        case 0x90: return "DCS"sv;
        case 0x91: return "PU1"sv;
        case 0x92: return "PU2"sv;
        case 0x93: return "STS"sv;
        case 0x94: return "CCH"sv;
        case 0x95: return "MW"sv;
        case 0x96: return "SPA"sv;
        case 0x97: return "EPA"sv;
        case 0x98: return "SOS"sv;
        case 0x99: return "SGCI"sv;
        case 0x9a: return "SCI"sv;
        case 0x9b: return "CSI"sv;
        case 0x9c: return "ST"sv;
        case 0x9d: return "OSC"sv;
        case 0x9e: return "PM"sv;
        case 0x9f: return "APC"sv;
        default: return ""sv;
        }
}

} // namespace copa::parser::detail
