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

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glib.h>

#include "parser.hh"
#include "parser-test-recorder.hh"

using namespace std::literals;
using namespace copa::parser;

using copa::parser::test::Recorder;

static constexpr std::string_view const k_fragments[] = {
        "\e"sv, "["sv, "]"sv, "P"sv, "X"sv, "^"sv, "_"sv, "\\"sv, "("sv,
        "0"sv, "1"sv, "9"sv, ";"sv, ":"sv, "?"sv, "<"sv, " "sv, "$"sv,
        "m"sv, "q"sv, "|"sv, "~"sv, "a"sv, "Hello"sv,
        "\a"sv, "\n"sv, "\x18"sv, "\x1a"sv, "\x7f"sv,
        "\x9b"sv, "\x9c"sv, "\x85"sv, "\xff"sv,
        "\xc3"sv, "\xa4"sv, "\xc3\xa4"sv, "\xe2\x82\xac"sv, "\xe2\x82"sv,
        "\xf0\x9f\x98\x80"sv, "\xf0\x9f"sv, "\xed\xa0\x80"sv,
        "\e[38:2::1;2m"sv, "\e]0;title\a"sv, "\eP1$q"sv, "\e\\"sv,
};

static std::string
random_input(size_t n_fragments)
{
        auto str = std::string{};
        for (auto i = size_t{0}; i < n_fragments; ++i)
                str.append(k_fragments[g_test_rand_int_range(0, int(G_N_ELEMENTS(k_fragments)))]);
        return str;
}

static std::vector<std::string>
parse(std::string_view str,
      bool fast_path = true)
{
        auto recorder = Recorder{};
        auto parser = Parser{};
        parser.set_fast_path(fast_path);
        parser.advance(recorder, str);
        return std::move(recorder.events);
}

static void
assert_same(std::vector<std::string> const& a,
            std::vector<std::string> const& b)
{
        g_assert_cmpuint(a.size(), ==, b.size());
        for (auto i = size_t{0}; i < a.size(); ++i)
                g_assert_cmpstr(a[i].c_str(), ==, b[i].c_str());
}

static void
test_parser_property_chunks(void)
{
        for (auto iter = 0; iter < 500; ++iter) {
                auto const str = random_input(g_test_rand_int_range(1, 200));
                auto const expected = parse(str);

                for (auto const fast_path : {true, false}) {
                        auto recorder = Recorder{};
                        auto parser = Parser{};
                        parser.set_fast_path(fast_path);

                        auto view = std::string_view{str};
                        while (!view.empty()) {
                                auto const len = std::min(size_t(g_test_rand_int_range(0, 16)), view.size());
                                parser.advance(recorder, view.substr(0, len));
                                view.remove_prefix(len);
                        }

                        assert_same(recorder.events, expected);
                }
        }
}

static void
test_parser_property_bytewise(void)
{
        for (auto iter = 0; iter < 100; ++iter) {
                auto const str = random_input(g_test_rand_int_range(1, 100));

                auto recorder = Recorder{};
                auto parser = Parser{};
                for (auto const c : str)
                        parser.advance(recorder, std::string_view{&c, 1});

                assert_same(recorder.events, parse(str));
        }
}

static void
test_parser_property_fast_path(void)
{
        for (auto iter = 0; iter < 500; ++iter) {
                auto const str = random_input(g_test_rand_int_range(1, 400));
                assert_same(parse(str, true), parse(str, false));
        }

        // Longer than one fast path chunk, with sequences straddling
        // the chunk boundaries
        for (auto iter = 0; iter < 20; ++iter) {
                auto str = std::string{};
                while (str.size() < 4 * Parser::k_fast_path_chunk) {
                        str.append(g_test_rand_int_range(0, 1100), 'x');
                        str.append(k_fragments[g_test_rand_int_range(0, int(G_N_ELEMENTS(k_fragments)))]);
                }

                assert_same(parse(str, true), parse(str, false));
        }
}

static void
test_parser_property_utf8(void)
{
        for (auto iter = 0; iter < 200; ++iter) {
                auto str = std::string{};
                auto const n = g_test_rand_int_range(1, 3000);
                for (auto i = 0; i < n; ++i) {
                        auto c = gunichar{0};
                        do {
                                switch (g_test_rand_int_range(0, 4)) {
                                case 0: c = g_test_rand_int_range(0x20, 0x7f); break;
                                case 1: c = g_test_rand_int_range(0xa0, 0x800); break;
                                case 2: c = g_test_rand_int_range(0x800, 0x10000); break;
                                default: c = g_test_rand_int_range(0x10000, 0x110000); break;
                                }
                        } while (!g_unichar_validate(c) || !g_unichar_isprint(c));

                        char ubuf[8];
                        str.append(ubuf, g_unichar_to_utf8(c, ubuf));
                }

                for (auto const fast_path : {true, false}) {
                        auto const events = parse(str, fast_path);
                        g_assert_cmpuint(events.size(), ==, 1);
                        g_assert_true(events[0] == "print:"s + str);
                }
        }
}

static void
test_parser_property_terminated(void)
{
        for (auto iter = 0; iter < 300; ++iter) {
                auto const str = random_input(g_test_rand_int_range(1, 200));
                auto const expected = parse(str);

                for (auto const fast_path : {true, false}) {
                        auto recorder = Recorder{};
                        auto parser = Parser{};
                        parser.set_fast_path(fast_path);

                        // Resuming after each termination yields the
                        // same callbacks as parsing in one go
                        auto view = std::string_view{str};
                        while (!view.empty()) {
                                recorder.stop_after = recorder.n_callbacks + g_test_rand_int_range(1, 4);
                                auto const n = parser.advance_until_terminated(recorder, view);
                                g_assert_cmpuint(n, <=, view.size());
                                view.remove_prefix(n);
                        }

                        assert_same(recorder.events, expected);
                }
        }
}

static void
test_parser_property_recover(void)
{
        // Whatever came before, CAN returns to ground state and
        // the following text is printed
        for (auto iter = 0; iter < 500; ++iter) {
                auto str = random_input(g_test_rand_int_range(1, 100));
                str.append("\x18" "ok");

                auto recorder = Recorder{};
                auto parser = Parser{};
                parser.advance(recorder, str);
                g_assert_true(parser.state() == State::GROUND);
                g_assert_cmpstr(recorder.events.back().c_str(), ==, "print:ok");
        }
}

int
main(int argc,
     char* argv[])
{
        g_test_init(&argc, &argv, nullptr);

        g_test_add_func("/copa/parser/property/chunks", test_parser_property_chunks);
        g_test_add_func("/copa/parser/property/bytewise", test_parser_property_bytewise);
        g_test_add_func("/copa/parser/property/fast-path", test_parser_property_fast_path);
        g_test_add_func("/copa/parser/property/utf8", test_parser_property_utf8);
        g_test_add_func("/copa/parser/property/terminated", test_parser_property_terminated);
        g_test_add_func("/copa/parser/property/recover", test_parser_property_recover);

        return g_test_run();
}
