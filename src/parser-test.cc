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

#include "config.h"

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <glib.h>

#include <fmt/format.h>

#include "copa/copa.hh"
#include "debug.hh"
#include "parser-fmt.hh"
#include "parser-test-recorder.hh"

#if COPA_SERIALIZE
#include "parser-variant.hh"
#endif

using namespace std::literals;
using namespace copa::parser;

using copa::parser::test::Recorder;

static void
assert_events(std::vector<std::string> const& events,
              std::initializer_list<std::string_view> expected)
{
        auto it = expected.begin();
        for (auto const& event : events) {
                if (it == expected.end())
                        g_error("Unexpected event \"%s\"", event.c_str());

                g_assert_cmpstr(event.c_str(), ==, std::string{*it}.c_str());
                ++it;
        }
        g_assert_cmpuint(events.size(), ==, expected.size());
}

/*
 * parse:
 * @recorder:
 * @str: the input
 * @expected: the expected events
 *
 * Parses @str with and without the ground fast path, and checks
 * the events recorded both times.
 */
static void
parse(Recorder& recorder,
      std::string_view str,
      std::initializer_list<std::string_view> expected)
{
        for (auto const fast_path : {true, false}) {
                auto parser = Parser{};
                parser.set_fast_path(fast_path);

                recorder.clear();
                parser.advance(recorder, str);
                assert_events(recorder.events, expected);
        }
}

static void
parse(std::string_view str,
      std::initializer_list<std::string_view> expected)
{
        auto recorder = Recorder{};
        parse(recorder, str, expected);
}

static void
test_parser_print(void)
{
        parse("Hello, world!"sv, {"print:Hello, world!"sv});
        parse("\xc3\xa4\xe2\x82\xac\xf0\x9f\x98\x80"sv, {"print:\xc3\xa4\xe2\x82\xac\xf0\x9f\x98\x80"sv});

        // DEL is printed in ground state
        parse("a\x7f"sv, {"print:a\x7f"sv});
}

static void
test_parser_execute(void)
{
        parse("a\r\nb"sv, {"print:a"sv, "execute:0x0d"sv, "execute:0x0a"sv, "print:b"sv});
        parse("\x00\x07\x08"sv, {"execute:0x00"sv, "execute:0x07"sv, "execute:0x08"sv});

        // 8-bit C1 controls are executed, not interpreted
        parse("a\x9b" "1m"sv, {"print:a"sv, "execute:0x9b"sv, "print:1m"sv});
        parse("\x90\x9d\x9c"sv, {"execute:0x90"sv, "execute:0x9d"sv, "execute:0x9c"sv});

        // and so are UTF-8 encoded ones
        parse("\xc2\x85"sv, {"execute:0x85"sv});
}

static void
test_parser_csi(void)
{
        auto recorder = Recorder{};

        parse(recorder, "\e[3;14m"sv, {"csi:3;14::m"sv});
        g_assert_cmpuint(recorder.params.size(), ==, 2);
        g_assert_cmpint(recorder.params.param(0), ==, 3);
        g_assert_cmpint(recorder.params.param(1), ==, 14);
        g_assert_true(recorder.intermediates.empty());

        parse(recorder, "\e[?25h"sv, {"csi:25:?:h"sv});
        g_assert_cmpuint(recorder.params.size(), ==, 1);
        g_assert_cmpint(recorder.params.param(0), ==, 25);
        g_assert_cmpuint(recorder.intermediates.size(), ==, 1);
        g_assert_cmpuint(recorder.intermediates[0], ==, '?');

        parse(recorder, "\e[ q"sv, {"csi:: :q"sv});
        parse(recorder, "\e[>4;2m"sv, {"csi:4;2:>:m"sv});
        parse(recorder, "\e[1$p"sv, {"csi:1:$:p"sv});
        parse(recorder, "a\e[Hb"sv, {"print:a"sv, "csi:::H"sv, "print:b"sv});
}

static void
test_parser_csi_default(void)
{
        auto recorder = Recorder{};

        // A sequence without parameters has one default parameter
        parse(recorder, "\e[m"sv, {"csi:::m"sv});
        g_assert_cmpuint(recorder.params.size(), ==, 1);
        g_assert_true(recorder.params.param_default(0));
        g_assert_cmpint(recorder.params.param(0), ==, 0);
        g_assert_cmpint(recorder.params.param(0, 1), ==, 1);

        // A trailing separator ends with an empty parameter
        parse(recorder, "\e[1;m"sv, {"csi:1;::m"sv});
        g_assert_cmpuint(recorder.params.size(), ==, 2);
        g_assert_cmpint(recorder.params.param(0), ==, 1);
        g_assert_cmpint(recorder.params.param(1), ==, 0);
        g_assert_true(recorder.params.param_default(1));

        parse(recorder, "\e[;5H"sv, {"csi:;5::H"sv});
        g_assert_cmpint(recorder.params.param(0, 1), ==, 1);
        g_assert_cmpint(recorder.params.param(1, 1), ==, 5);

        // An explicit zero is not a default parameter
        parse(recorder, "\e[0m"sv, {"csi:0::m"sv});
        g_assert_false(recorder.params.param_default(0));
        g_assert_cmpint(recorder.params.param(0, 1), ==, 0);

        // Out of range
        g_assert_cmpint(recorder.params.param(7), ==, 0);
        g_assert_cmpint(recorder.params.param(7, 42), ==, 42);
}

static void
test_parser_csi_subparams(void)
{
        auto recorder = Recorder{};

        parse(recorder, "\e[38:2::255:128:0;1m"sv, {"csi:38:2::255:128:0;1::m"sv});
        auto const& params = recorder.params;
        g_assert_cmpuint(params.size(), ==, 7);
        g_assert_cmpuint(params.n_groups(), ==, 2);
        g_assert_true(params.param_nonfinal(0));
        g_assert_false(params.param_subparam(0));
        g_assert_true(params.param_subparam(1));
        g_assert_true(params.param_default(2));
        g_assert_cmpint(params.param(3), ==, 255);
        g_assert_false(params.param_nonfinal(5));
        g_assert_false(params.param_subparam(6));
        g_assert_cmpuint(params.next(0), ==, 6);
        g_assert_cmpuint(params.next(6), ==, 7);

        auto n = 0u;
        for (auto const group : params) {
                switch (n++) {
                case 0:
                        g_assert_cmpuint(group.size(), ==, 6);
                        g_assert_cmpint(group[0].value(), ==, 38);
                        g_assert_cmpint(group[5].value(), ==, 0);
                        break;
                case 1:
                        g_assert_cmpuint(group.size(), ==, 1);
                        g_assert_cmpint(group[0].value_final(), ==, 1);
                        break;
                default:
                        g_assert_not_reached();
                }
        }
        g_assert_cmpuint(n, ==, 2);

        parse(recorder, "\e[4:3m"sv, {"csi:4:3::m"sv});
        g_assert_cmpint(recorder.params.arg(0).value_final(), ==, -1);
        g_assert_cmpint(recorder.params.arg(1).value_final(), ==, 3);
}

static void
test_parser_csi_overflow(void)
{
        auto recorder = Recorder{};

        // Values saturate
        parse(recorder, "\e[65535;65536;99999999m"sv, {"csi:65535;65535;65535::m"sv});

        auto str = "\e["s;
        str.append(2000, '9');
        str.append("mok");
        parse(recorder, str, {"csi:65535::m"sv, "print:ok"sv});

        // Exactly the maximum number of parameters
        str = "\e["s;
        for (auto i = 1u; i < Params::k_max; ++i)
                str.append(fmt::format("{};", i));
        str.append("32m");
        recorder.clear();
        auto parser = Parser{};
        parser.advance(recorder, str);
        g_assert_cmpuint(recorder.events.size(), ==, 1);
        g_assert_true(recorder.events[0].starts_with("csi:1;2;3;"));
        g_assert_cmpuint(recorder.params.size(), ==, Params::k_max);
        g_assert_cmpint(recorder.params.param(Params::k_max - 1), ==, 32);

        // One more makes the sequence ignored, but it still ends
        // at the final byte
        for (auto const extra : {";33m"sv, ";m"sv, ":1m"sv}) {
                str = "\e["s;
                for (auto i = 1u; i <= Params::k_max; ++i)
                        str.append(fmt::format("{};", i));
                str.pop_back();
                str.append(extra);
                str.append("x");

                recorder.clear();
                parser.advance(recorder, str);
                g_assert_cmpuint(recorder.events.size(), ==, 2);
                g_assert_true(recorder.events[0].starts_with("csi!:1;2;3;"));
                g_assert_true(recorder.events[0].ends_with(":m"));
                g_assert_cmpstr(recorder.events[1].c_str(), ==, "print:x");
                g_assert_cmpuint(recorder.params.size(), ==, Params::k_max);
        }
        g_assert_true(parser.state() == State::GROUND);

        // Too many intermediates
        parse(recorder, "\e[1 !\"pz"sv, {"csi!:1: !:p"sv, "print:z"sv});
        g_assert_cmpuint(recorder.intermediates.size(), ==, Intermediates::k_max);

        // The next sequence is not affected
        parse(recorder, "\e[1 !\"p\e[2m"sv, {"csi!:1: !:p"sv, "csi:2::m"sv});
}

static void
test_parser_csi_ignore(void)
{
        // Private parameter bytes after parameters
        parse("\e[1?2hX"sv, {"print:X"sv});
        parse("\e[1;2<mX"sv, {"print:X"sv});

        // Parameter bytes after intermediates
        parse("\e[ 1qX"sv, {"print:X"sv});

        // C0 controls are still executed
        parse("\e[1?\n2hX"sv, {"execute:0x0a"sv, "print:X"sv});
}

static void
test_parser_csi_controls(void)
{
        // C0 controls are executed inside the sequence
        parse("\e[1\n2m"sv, {"execute:0x0a"sv, "csi:12::m"sv});
        parse("\e[\b;3H"sv, {"execute:0x08"sv, "csi:;3::H"sv});

        // DEL is ignored inside the sequence
        parse("\e[1\x7f" "2m"sv, {"csi:12::m"sv});

        // 8-bit bytes are ignored inside the sequence
        parse("\e[1\x9b" "2m"sv, {"csi:12::m"sv});
}

static void
test_parser_esc(void)
{
        auto recorder = Recorder{};

        parse(recorder, "\e7"sv, {"esc::7"sv});
        parse(recorder, "\ec"sv, {"esc::c"sv});
        parse(recorder, "\e(B"sv, {"esc:(:B"sv});
        g_assert_cmpuint(recorder.intermediates.size(), ==, 1);
        g_assert_cmpuint(recorder.intermediates[0], ==, '(');

        parse(recorder, "\e#8"sv, {"esc:#:8"sv});
        parse(recorder, "\e\\"sv, {"esc::\\"sv});

        // Too many intermediates
        parse(recorder, "\e$(-%Bx"sv, {"esc!:$(:B"sv, "print:x"sv});

        // ESC restarts the sequence
        parse(recorder, "\e(\e7"sv, {"esc::7"sv});
        parse(recorder, "\e\e7"sv, {"esc::7"sv});
        parse(recorder, "\e[12;\e7"sv, {"esc::7"sv});

        // C0 controls are executed inside the sequence
        parse(recorder, "\e(\rB"sv, {"execute:0x0d"sv, "esc:(:B"sv});

        // DEL is ignored
        parse(recorder, "\e\x7f" "7"sv, {"esc::7"sv});
}

static void
test_parser_cancel(void)
{
        for (auto const cancel : {"\x18"sv, "\x1a"sv}) {
                auto const execute = fmt::format("execute:{:#04x}", uint8_t(cancel[0]));
                for (auto const prefix : {"\e"sv, "\e("sv, "\e[1;"sv, "\e[ "sv, "\e[?1<"sv,
                                          "\eP1"sv, "\eP "sv, "\eP1<"sv}) {
                        auto str = std::string{prefix};
                        str.append(cancel);
                        str.append("A");

                        auto recorder = Recorder{};
                        auto parser = Parser{};
                        parser.advance(recorder, str);
                        assert_events(recorder.events, {execute, "print:A"sv});
                        g_assert_true(parser.state() == State::GROUND);
                }
        }

        // In DCS passthrough, the string is ended first
        parse("\eP1q#\x18" "A"sv,
              {"hook:1::q"sv, "put:#"sv, "unhook"sv, "execute:0x18"sv, "print:A"sv});
}

static void
test_parser_osc(void)
{
        auto recorder = Recorder{};

        parse(recorder, "\e]0;hello\a"sv, {"osc:0|hello:bel"sv});
        g_assert_cmpuint(recorder.osc_fields.size(), ==, 2);
        g_assert_cmpstr(recorder.osc_fields[0].c_str(), ==, "0");
        g_assert_cmpstr(recorder.osc_fields[1].c_str(), ==, "hello");

        // ST, as ESC \, ends the OSC and then dispatches
        parse(recorder, "\e]2;title\e\\"sv, {"osc:2|title:st"sv, "esc::\\"sv});

        // CAN and SUB end the OSC and are executed
        parse(recorder, "\e]2;abc\x18" "d"sv, {"osc:2|abc:st"sv, "execute:0x18"sv, "print:d"sv});
        parse(recorder, "\e]2;abc\x1a"sv, {"osc:2|abc:st"sv, "execute:0x1a"sv});

        // Another sequence
        parse(recorder, "\e]2;abc\e[1m"sv, {"osc:2|abc:st"sv, "csi:1::m"sv});

        // 8-bit bytes are payload, including 9/12
        parse(recorder, "\e]0;t\xc3\xa4st\a"sv, {"osc:0|t\xc3\xa4st:bel"sv});
        parse(recorder, "\e]0;\x9c\a"sv, {"osc:0|\x9c:bel"sv});

        // Empty fields
        parse(recorder, "\e]\a"sv, {"osc::bel"sv});
        g_assert_cmpuint(recorder.osc_fields.size(), ==, 1);
        g_assert_true(recorder.osc_fields[0].empty());

        parse(recorder, "\e]8;;https://example.com\a"sv, {"osc:8||https://example.com:bel"sv});
        g_assert_cmpuint(recorder.osc_fields.size(), ==, 3);

        // Other C0 controls are ignored
        parse(recorder, "\e]0;a\nb\a"sv, {"osc:0|ab:bel"sv});
}

static void
test_parser_osc_fields(void)
{
        auto str = "\e]"s;
        for (auto i = 0u; i < 20u; ++i)
                str.append(fmt::format("{};", i));
        str.append("\a");

        auto recorder = Recorder{};
        auto parser = Parser{};
        parser.advance(recorder, str);
        g_assert_cmpuint(recorder.events.size(), ==, 1);
        g_assert_cmpuint(recorder.osc_fields.size(), ==, OscFields::k_max);
        g_assert_cmpstr(recorder.osc_fields.front().c_str(), ==, "0");
        g_assert_cmpstr(recorder.osc_fields.back().c_str(), ==, "15");
}

static void
test_parser_osc_overflow(void)
{
        auto recorder = Recorder{};
        auto parser = Parser{};

        // The payload is bounded; an overflowed OSC is not dispatched
        auto str = "\e]2;"s;
        str.append(OscPayload::k_max_capacity + 16, 'x');
        str.append("\a");
        str.append("ok");
        parser.advance(recorder, str);
        assert_events(recorder.events, {"print:ok"sv});
        g_assert_true(parser.state() == State::GROUND);

        // The next OSC is dispatched normally
        recorder.clear();
        parser.advance(recorder, "\e]2;next\a"sv);
        assert_events(recorder.events, {"osc:2|next:bel"sv});
}

static void
test_parser_dcs(void)
{
        auto recorder = Recorder{};

        parse(recorder, "\eP1;2|data\e\\"sv, {"hook:1;2::|"sv, "put:data"sv, "unhook"sv, "esc::\\"sv});
        g_assert_cmpuint(recorder.params.size(), ==, 2);
        g_assert_cmpint(recorder.params.param(1), ==, 2);

        // 8-bit ST
        parse(recorder, "\eP$qm\x9c"sv, {"hook::$:q"sv, "put:m"sv, "unhook"sv});
        g_assert_cmpuint(recorder.intermediates.size(), ==, 1);

        parse(recorder, "\eP>|\x9c"sv, {"hook::>:|"sv, "unhook"sv});

        // C0 controls are passed through, DEL and 8-bit bytes are not
        parse(recorder, "\eP0q\r\n#\x7f\xc3\xa4\x9c"sv,
              {"hook:0::q"sv, "put:\r\n#"sv, "unhook"sv});

        // Other sequences end the string
        parse(recorder, "\ePqab\e[m"sv, {"hook:::q"sv, "put:ab"sv, "unhook"sv, "csi:::m"sv});
}

static void
test_parser_dcs_ignore(void)
{
        // Parameter bytes after private parameters
        parse("\eP1<2qdata\x9cX"sv, {"print:X"sv});

        // Parameter bytes after intermediates
        parse("\eP1$2qdata\x9cX"sv, {"print:X"sv});

        // ESC ends the ignored string
        parse("\eP1$2qdata\e\\X"sv, {"esc::\\"sv, "print:X"sv});

        // Too many parameters or intermediates still hook
        parse("\eP !\"qx\x9c"sv, {"hook!:: !:q"sv, "put:x"sv, "unhook"sv});
}

static void
test_parser_sos_pm_apc(void)
{
        parse("\e_Gf=1;abc\e\\"sv, {"apc_start"sv, "apc_put:Gf=1;abc"sv, "apc_end"sv, "esc::\\"sv});
        parse("\eXsos\a"sv, {"sos_start"sv, "sos_put:sos"sv, "sos_end"sv});
        parse("\e^pm\x18"sv, {"pm_start"sv, "pm_put:pm"sv, "pm_end"sv, "execute:0x18"sv});

        // Empty string
        parse("\e_\a"sv, {"apc_start"sv, "apc_end"sv});

        // 8-bit bytes are payload
        parse("\e_\xc3\xa4\a"sv, {"apc_start"sv, "apc_put:\xc3\xa4"sv, "apc_end"sv});
}

static void
test_parser_utf8_split(void)
{
        auto const str = "a\xe2\x82\xac" "b\xf0\x9f\x98\x80"sv;

        for (auto const fast_path : {true, false}) {
                for (auto split = 0u; split <= str.size(); ++split) {
                        auto recorder = Recorder{};
                        auto parser = Parser{};
                        parser.set_fast_path(fast_path);
                        parser.advance(recorder, str.substr(0, split));
                        parser.advance(recorder, str.substr(split));
                        assert_events(recorder.events, {"print:a\xe2\x82\xac" "b\xf0\x9f\x98\x80"sv});
                        g_assert_cmpuint(recorder.n_callbacks, ==, 4);
                }
        }
}

static void
test_parser_utf8_short_runs(void)
{
        auto recorder = Recorder{};

        // Short non-ASCII runs between sequences
        parse(recorder, "\e[31m\xc3\xa4\e[0m\e[31m\xc3\xa4\e[0m"sv,
              {"csi:31::m"sv, "print:\xc3\xa4"sv, "csi:0::m"sv,
               "csi:31::m"sv, "print:\xc3\xa4"sv, "csi:0::m"sv});

        // Bytes that cannot start a sequence, followed by text
        parse(recorder, "\x80\xff" "ab\xc3\xa4"sv,
              {"execute:0x80"sv, "print:\xef\xbf\xbd" "ab\xc3\xa4"sv});
        g_assert_cmpuint(recorder.n_callbacks, ==, 5);

        parse(recorder, "\xc0\xc1\xf5\xfe"sv,
              {"print:\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd"sv});
}

static void
test_parser_utf8_invalid(void)
{
        auto recorder = Recorder{};

        // An incomplete sequence is replaced, and the byte that
        // ended it is processed normally
        parse(recorder, "\xc3" "A"sv, {"print:\xef\xbf\xbd" "A"sv});
        g_assert_cmpuint(recorder.n_callbacks, ==, 2);

        parse(recorder, "\xe2\x82" "\e[m"sv, {"print:\xef\xbf\xbd"sv, "csi:::m"sv});
        parse(recorder, "\xc3\n"sv, {"print:\xef\xbf\xbd"sv, "execute:0x0a"sv});
        parse(recorder, "\xc3\x18"sv, {"print:\xef\xbf\xbd"sv, "execute:0x18"sv});

        // Invalid bytes
        parse(recorder, "a\xff" "b\xc0\xaf"sv, {"print:a\xef\xbf\xbd" "b\xef\xbf\xbd\xef\xbf\xbd"sv});
        g_assert_cmpuint(recorder.n_callbacks, ==, 5);

        // Surrogates
        parse(recorder, "\xed\xbf\xbf"sv, {"print:\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd"sv});

        // A lone continuation in the C1 range is a C1 control
        parse(recorder, "\x85"sv, {"execute:0x85"sv});
        parse(recorder, "\xa0"sv, {"print:\xef\xbf\xbd"sv});
}

static void
test_parser_terminated(void)
{
        auto const str = "ab\e[1mcd\xe2\x82\xac"sv;

        for (auto const fast_path : {true, false}) {
                auto recorder = Recorder{};
                auto parser = Parser{};
                parser.set_fast_path(fast_path);

                recorder.stop_after = 1;
                auto n = parser.advance_until_terminated(recorder, str);
                g_assert_cmpuint(n, ==, 1);
                assert_events(recorder.events, {"print:a"sv});

                recorder.stop_after = 3;
                n += parser.advance_until_terminated(recorder, str.substr(n));
                g_assert_cmpuint(n, ==, 6);
                assert_events(recorder.events, {"print:ab"sv, "csi:1::m"sv});
                g_assert_true(parser.state() == State::GROUND);

                recorder.stop_after = 6;
                n += parser.advance_until_terminated(recorder, str.substr(n));
                g_assert_cmpuint(n, ==, str.size());
                assert_events(recorder.events, {"print:ab"sv, "csi:1::m"sv, "print:cd\xe2\x82\xac"sv});

                // Nothing is consumed once terminated
                g_assert_cmpuint(parser.advance_until_terminated(recorder, "xyz"sv), ==, 0);
                g_assert_cmpuint(recorder.n_callbacks, ==, 6);
        }
}

static void
test_parser_terminated_rewind(void)
{
        // The byte that ends an invalid sequence is not consumed
        // when terminating right after the replacement character
        auto recorder = Recorder{};
        auto parser = Parser{};
        recorder.stop_after = 1;

        auto const n = parser.advance_until_terminated(recorder, "\xc3" "A"sv);
        g_assert_cmpuint(n, ==, 1);
        assert_events(recorder.events, {"print:\xef\xbf\xbd"sv});
        g_assert_true(parser.state() == State::GROUND);

        recorder.stop_after = size_t(-1);
        parser.advance_until_terminated(recorder, "A"sv);
        assert_events(recorder.events, {"print:\xef\xbf\xbd" "A"sv});
}

static void
test_parser_state(void)
{
        auto const check = [](std::string_view str,
                              State expected) {
                auto recorder = Recorder{};
                auto parser = Parser{};
                parser.advance(recorder, str);
                g_assert_cmpstr(fmt::format("{}", parser.state()).c_str(), ==,
                                fmt::format("{}", expected).c_str());
        };

        check(""sv, State::GROUND);
        check("abc"sv, State::GROUND);
        check("\e"sv, State::ESCAPE);
        check("\e("sv, State::ESCAPE_INTERMEDIATE);
        check("\e["sv, State::CSI_ENTRY);
        check("\e[1"sv, State::CSI_PARAM);
        check("\e[?"sv, State::CSI_PARAM);
        check("\e[1 "sv, State::CSI_INTERMEDIATE);
        check("\e[1?"sv, State::CSI_IGNORE);
        check("\eP"sv, State::DCS_ENTRY);
        check("\eP1;"sv, State::DCS_PARAM);
        check("\eP$"sv, State::DCS_INTERMEDIATE);
        check("\ePq"sv, State::DCS_PASSTHROUGH);
        check("\eP$1"sv, State::DCS_IGNORE);
        check("\e]"sv, State::OSC_STRING);
        check("\eX"sv, State::SOS_PM_APC_STRING);
        check("\e_"sv, State::SOS_PM_APC_STRING);
        check("\xe2\x82"sv, State::UTF8_CONTINUATION);
}

static void
test_parser_reset(void)
{
        auto recorder = Recorder{};
        auto parser = Parser{};

        for (auto const prefix : {"\e[12;3"sv, "\e]0;title"sv, "\eP1q"sv, "\e_abc"sv, "\xf0\x9f"sv}) {
                recorder.clear();
                parser.advance(recorder, prefix);
                parser.reset();
                g_assert_true(parser.state() == State::GROUND);
                g_assert_true(parser.collector().params().empty());

                parser.advance(recorder, "m\e[2m"sv);
                g_assert_cmpuint(recorder.events.size(), >=, 2);
                g_assert_cmpstr(recorder.events[recorder.events.size() - 2].c_str(), ==, "print:m");
                g_assert_cmpstr(recorder.events.back().c_str(), ==, "csi:2::m");
        }
}

static void
test_parser_copy(void)
{
        auto recorder = Recorder{};
        auto parser = Parser{};
        parser.advance(recorder, "\e]0;ti"sv);

        auto copy = Parser{parser};
        g_assert_true(copy.state() == State::OSC_STRING);

        recorder.clear();
        parser.advance(recorder, "tle\a"sv);
        assert_events(recorder.events, {"osc:0|title:bel"sv});

        recorder.clear();
        copy.advance(recorder, "me\a"sv);
        assert_events(recorder.events, {"osc:0|time:bel"sv});
}

static void
test_parser_default_performer(void)
{
        class Null : public Performer { };

        auto performer = Null{};
        auto parser = Parser{};
        parser.advance(performer, "a\e[1m\e]0;x\a\eP1qx\e\\\e_x\e\\\xc3"sv);
        g_assert_true(parser.state() == State::UTF8_CONTINUATION);
        g_assert_false(performer.terminated());
}

static void
test_parser_final_bytes(void)
{
        class Finals final : public Performer {
        public:
                std::string finals;

                void csi_dispatch(Params const&, Intermediates const&, bool, char final) override
                {
                        finals.push_back(final);
                }

                void esc_dispatch(Intermediates const&, bool, char final) override
                {
                        finals.push_back(final);
                }

                void hook(Params const&, Intermediates const&, bool, char final) override
                {
                        finals.push_back(final);
                }
        };

        auto performer = Finals{};
        auto parser = Parser{};
        parser.advance(performer, "\e7\e[5n\eP1q#\e\\\e(B\e[?25~"sv);
        g_assert_cmpstr(performer.finals.c_str(), ==, "7nq\\B~");
}

static void
test_parser_debug_init(void)
{
        if (g_test_subprocess()) {
                // Nothing has been parsed in this process yet
                g_setenv("COPA_DEBUG", "parser", true);

                auto recorder = Recorder{};
                auto parser = Parser{};
                parser.advance(recorder, "\e[m"sv);
                assert_events(recorder.events, {"csi:::m"sv});

#if COPA_DEBUG
                g_assert_true(copa::debug::check_categories(copa::debug::category::PARSER));
                g_assert_false(copa::debug::check_categories(copa::debug::category::OSC));
#endif
                return;
        }

        g_test_trap_subprocess(nullptr, 0, G_TEST_SUBPROCESS_DEFAULT);
        g_test_trap_assert_passed();
#if COPA_DEBUG
        g_test_trap_assert_stderr("*copa debug flags*");
#endif
}

static void
test_parser_format(void)
{
        auto recorder = Recorder{};
        auto parser = Parser{};
        parser.advance(recorder, "\e[1;;3:4 !m"sv);

        g_assert_cmpstr(fmt::format("{}", recorder.params).c_str(), ==, "1;;3:4");
        g_assert_cmpstr(fmt::format("{}", recorder.intermediates).c_str(), ==, "SP !");
        g_assert_cmpstr(fmt::format("{}", State::DCS_PASSTHROUGH).c_str(), ==, "DCS_PASSTHROUGH");
        g_assert_cmpstr(fmt::format("{}", Action::OSC_END).c_str(), ==, "OSC_END");
}

static void
test_parser_version(void)
{
        static_assert(COPA_CHECK_VERSION(0, 1, 0));
        static_assert(!COPA_CHECK_VERSION(COPA_MAJOR_VERSION + 1, 0, 0));
}

#if COPA_SERIALIZE

static void
test_parser_variant(void)
{
        auto recorder = Recorder{};
        auto parser = Parser{};
        parser.advance(recorder, "\e[38:2::1;;7 $p"sv);

        auto const pv = to_variant(recorder.params);
        g_assert_true(g_variant_is_of_type(pv.get(), G_VARIANT_TYPE("ai")));
        auto const params = params_from_variant(pv.get());
        g_assert_true(params.has_value());
        g_assert_cmpuint(params->size(), ==, recorder.params.size());
        for (auto i = 0u; i < params->size(); ++i)
                g_assert_cmpint(params->arg(i).encoded(), ==, recorder.params.arg(i).encoded());

        auto const iv = to_variant(recorder.intermediates);
        auto const intermediates = intermediates_from_variant(iv.get());
        g_assert_true(intermediates.has_value());
        g_assert_true(*intermediates == recorder.intermediates);

        auto const stv = to_variant(State::CSI_IGNORE);
        auto const state = state_from_variant(stv.get());
        g_assert_true(state.has_value());
        g_assert_true(*state == State::CSI_IGNORE);

        // Wrong types and out of range values
        auto const str = copa::take_freeable(g_variant_ref_sink(g_variant_new_string("x")));
        g_assert_false(params_from_variant(str.get()).has_value());
        g_assert_false(intermediates_from_variant(str.get()).has_value());
        g_assert_false(state_from_variant(str.get()).has_value());

        auto const bad_state = copa::take_freeable(g_variant_ref_sink(g_variant_new_byte(0xff)));
        g_assert_false(state_from_variant(bad_state.get()).has_value());

        auto const long_intermediates = copa::take_freeable
                (g_variant_ref_sink(g_variant_new_bytestring("((((")));
        g_assert_false(intermediates_from_variant(long_intermediates.get()).has_value());
}

#endif // COPA_SERIALIZE

int
main(int argc,
     char* argv[])
{
        g_test_init(&argc, &argv, nullptr);

        g_test_add_func("/copa/parser/print", test_parser_print);
        g_test_add_func("/copa/parser/execute", test_parser_execute);
        g_test_add_func("/copa/parser/csi", test_parser_csi);
        g_test_add_func("/copa/parser/csi/default", test_parser_csi_default);
        g_test_add_func("/copa/parser/csi/subparams", test_parser_csi_subparams);
        g_test_add_func("/copa/parser/csi/overflow", test_parser_csi_overflow);
        g_test_add_func("/copa/parser/csi/ignore", test_parser_csi_ignore);
        g_test_add_func("/copa/parser/csi/controls", test_parser_csi_controls);
        g_test_add_func("/copa/parser/esc", test_parser_esc);
        g_test_add_func("/copa/parser/cancel", test_parser_cancel);
        g_test_add_func("/copa/parser/osc", test_parser_osc);
        g_test_add_func("/copa/parser/osc/fields", test_parser_osc_fields);
        g_test_add_func("/copa/parser/osc/overflow", test_parser_osc_overflow);
        g_test_add_func("/copa/parser/dcs", test_parser_dcs);
        g_test_add_func("/copa/parser/dcs/ignore", test_parser_dcs_ignore);
        g_test_add_func("/copa/parser/sos-pm-apc", test_parser_sos_pm_apc);
        g_test_add_func("/copa/parser/utf8/split", test_parser_utf8_split);
        g_test_add_func("/copa/parser/utf8/short-runs", test_parser_utf8_short_runs);
        g_test_add_func("/copa/parser/utf8/invalid", test_parser_utf8_invalid);
        g_test_add_func("/copa/parser/terminated", test_parser_terminated);
        g_test_add_func("/copa/parser/terminated/rewind", test_parser_terminated_rewind);
        g_test_add_func("/copa/parser/state", test_parser_state);
        g_test_add_func("/copa/parser/reset", test_parser_reset);
        g_test_add_func("/copa/parser/copy", test_parser_copy);
        g_test_add_func("/copa/parser/default-performer", test_parser_default_performer);
        g_test_add_func("/copa/parser/final-bytes", test_parser_final_bytes);
        g_test_add_func("/copa/parser/debug-init", test_parser_debug_init);
        g_test_add_func("/copa/parser/format", test_parser_format);
        g_test_add_func("/copa/parser/version", test_parser_version);
#if COPA_SERIALIZE
        g_test_add_func("/copa/parser/variant", test_parser_variant);
#endif

        return g_test_run();
}
