/*
 * Copyright © 2018 Christian Persch
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

#include <cstring>
#include <string>
#include <string_view>

#include <glib.h>

using namespace std::literals;
using namespace copa::base;

using Result = UTF8Decoder::Result;

static void
test_utf8_decoder_decode(void)
{
        auto decoder = UTF8Decoder{};

        uint8_t buf[7];
        for (uint32_t cp = 0; cp < 0x110000u; ++cp) {
                if ((cp & 0xfffff800) == 0xd800u)
                        continue; // surrogate

                auto const len = g_unichar_to_utf8(cp, (char*)buf);
                g_assert_cmpuint(UTF8Decoder::sequence_length(buf[0]), ==, unsigned(len));

                auto result = Result::NEED_MORE;
                for (auto i = 0; i < len; ++i) {
                        result = decoder.decode(buf[i]);
                        if (i + 1 < len) {
                                g_assert_true(result == Result::NEED_MORE);
                                g_assert_cmpuint(decoder.pending(), ==, unsigned(i + 1));
                        }
                }
                g_assert_true(result == Result::ACCEPT);
                g_assert_false(decoder.in_sequence());
                g_assert_cmpuint(decoder.codepoint(), ==, cp);
        }
}

static std::u32string
decode(std::string_view in)
{
        auto decoder = UTF8Decoder{};
        auto out = std::u32string{};

        auto const iend = in.end();
        for (auto iptr = in.begin(); iptr < iend; ++iptr) {
                switch (decoder.decode(uint8_t(*iptr))) {
                case Result::REJECT_REWIND:
                        // This byte is consumed in the next round
                        --iptr;
                        [[fallthrough]];
                case Result::REJECT:
                        decoder.reset_fallback();
                        [[fallthrough]];
                case Result::ACCEPT:
                        out.push_back(decoder.codepoint());
                        break;
                case Result::NEED_MORE:
                        break;
                }
        }

        // A sequence cut off by the end of input
        if (decoder.flush())
                out.push_back(decoder.codepoint());

        return out;
}

static void
assert_decode(std::string_view in,
              std::u32string_view expected)
{
        auto const converted = decode(in);
        g_assert_cmpuint(converted.size(), ==, expected.size());
        g_assert_true(converted == expected);
}

static void
test_utf8_decoder_replacement(void)
{
        // Test vectors from encoding_rs (Copyright 2015-2016 Mozilla Foundation, MIT or Apache-2.0)
        struct {
                std::string_view in;
                std::u32string_view out;
        } const vectors[] = {
                { ""sv, U""sv },
                { "\0"sv, U"\0"sv },
                { "a\xC3\xA4Z"sv, U"a\u00E4Z"sv },
                { "a\xE2\x98\x83Z"sv, U"a\u2603Z"sv },
                { "a\xF0\x9F\x92\xA9Z"sv, U"a\U0001F4A9Z"sv },

                // truncated sequences
                { "a\xC3Z"sv, U"a\uFFFDZ"sv },
                { "a\xC3"sv, U"a\uFFFD"sv },
                { "a\xE2\x98Z"sv, U"a\uFFFDZ"sv },
                { "a\xE2\x98"sv, U"a\uFFFD"sv },
                { "a\xF0\x9F\x92Z"sv, U"a\uFFFDZ"sv },
                { "a\xF0\x9F\x92"sv, U"a\uFFFD"sv },

                // lone continuations
                { "a\xBF\xBFZ"sv, U"a\uFFFD\uFFFDZ"sv },
                { "a\xC3\xA4\x80Z"sv, U"a\u00E4\uFFFDZ"sv },
                { "a\xF0\x9F\x92\xA9\xBF"sv, U"a\U0001F4A9\uFFFD"sv },
                { "a\x80\x80\x80\x80"sv, U"a\uFFFD\uFFFD\uFFFD\uFFFD"sv },

                // overlong forms
                { "a\xC0\x80Z"sv, U"a\uFFFD\uFFFDZ"sv },
                { "a\xC1\xBF"sv, U"a\uFFFD\uFFFD"sv },
                { "a\xE0\x80\x80Z"sv, U"a\uFFFD\uFFFD\uFFFDZ"sv },
                { "a\xE0\x9F\xBF"sv, U"a\uFFFD\uFFFD\uFFFD"sv },
                { "a\xF0\x80\x80\x80Z"sv, U"a\uFFFD\uFFFD\uFFFD\uFFFDZ"sv },
                { "a\xF0\x8F\xBF\xBF"sv, U"a\uFFFD\uFFFD\uFFFD\uFFFD"sv },

                // boundaries
                { "a\x7F"sv, U"a\u007F"sv },
                { "a\xC2\x80"sv, U"a\u0080"sv },
                { "a\xC2\x7FZ"sv, U"a\uFFFD\u007FZ"sv },
                { "a\xDF\xBF"sv, U"a\u07FF"sv },
                { "a\xE0\xA0\x80"sv, U"a\u0800"sv },
                { "a\xEF\xBF\xBF"sv, U"a\uFFFF"sv },
                { "a\xF0\x90\x80\x80"sv, U"a\U00010000"sv },
                { "a\xF4\x8F\xBF\xBFZ"sv, U"a\U0010FFFFZ"sv },

                // surrogates
                { "a\xED\x9F\xBF"sv, U"a\uD7FF"sv },
                { "a\xED\xA0\x80Z"sv, U"a\uFFFD\uFFFD\uFFFDZ"sv },
                { "a\xED\xBF\xBF"sv, U"a\uFFFD\uFFFD\uFFFD"sv },
                { "a\xEE\x80\x80"sv, U"a\uE000"sv },

                // out of range
                { "a\xF4\x90\x80\x80Z"sv, U"a\uFFFD\uFFFD\uFFFD\uFFFDZ"sv },
                { "a\xF4\x8F\xBF\xFFZ"sv, U"a\uFFFD\uFFFDZ"sv },
                { "a\xFF"sv, U"a\uFFFD"sv },
                { "\xF8\x80\x80\x80\x80"sv, U"\uFFFD\uFFFD\uFFFD\uFFFD\uFFFD"sv },
                { "\xFE\xBF\xBF\xBF\xBF\xBF\xBF"sv, U"\uFFFD\uFFFD\uFFFD\uFFFD\uFFFD\uFFFD\uFFFD"sv },
        };

        for (auto const& v : vectors)
                assert_decode(v.in, v.out);
}

static void
test_utf8_decoder_reject(void)
{
        auto decoder = UTF8Decoder{};

        // Bytes that cannot start a sequence are consumed
        for (auto b : {0x80u, 0x9bu, 0xbfu, 0xc0u, 0xc1u, 0xf5u, 0xffu}) {
                g_assert_true(decoder.decode(uint8_t(b)) == Result::REJECT);
                g_assert_false(decoder.in_sequence());
                g_assert_cmpuint(UTF8Decoder::sequence_length(uint8_t(b)), ==, 0);
        }

        // A byte cutting a sequence short is not consumed
        g_assert_true(decoder.decode(0xe2) == Result::NEED_MORE);
        g_assert_true(decoder.decode(0x98) == Result::NEED_MORE);
        g_assert_cmpuint(decoder.needed(), ==, 1);
        g_assert_true(decoder.decode('A') == Result::REJECT_REWIND);
        g_assert_false(decoder.in_sequence());
        g_assert_true(decoder.decode('A') == Result::ACCEPT);
        g_assert_cmpuint(decoder.codepoint(), ==, 'A');

        // ESC aborts a sequence too
        g_assert_true(decoder.decode(0xf0) == Result::NEED_MORE);
        g_assert_true(decoder.decode(0x1b) == Result::REJECT_REWIND);
        g_assert_true(decoder.decode(0x1b) == Result::ACCEPT);
        g_assert_cmpuint(decoder.codepoint(), ==, 0x1b);
}

static void
test_utf8_decoder_bounded(void)
{
        auto decoder = UTF8Decoder{};

        // Every lead byte followed by an endless run of continuation
        // bytes yields a code point or a rejection within 4 bytes.
        for (auto lead = 0xc2u; lead < 0xf5u; ++lead) {
                decoder.reset_clear();
                g_assert_true(decoder.decode(uint8_t(lead)) == Result::NEED_MORE);

                auto n = 1u;
                auto result = Result::NEED_MORE;
                while (result == Result::NEED_MORE) {
                        result = decoder.decode(0x90);
                        ++n;
                        g_assert_cmpuint(decoder.pending(), <=, 3);
                }
                g_assert_cmpuint(n, <=, 4);
        }
}

static void
test_utf8_decoder_flush(void)
{
        auto decoder = UTF8Decoder{};

        g_assert_false(decoder.flush());
        g_assert_cmpuint(decoder.codepoint(), ==, 0);

        g_assert_true(decoder.decode(0xf0) == Result::NEED_MORE);
        g_assert_true(decoder.decode(0x9f) == Result::NEED_MORE);
        g_assert_true(decoder.flush());
        g_assert_cmpuint(decoder.codepoint(), ==, 0xfffd);
        g_assert_false(decoder.in_sequence());
}

int
main(int argc,
     char* argv[])
{
        g_test_init(&argc, &argv, nullptr);

        g_test_add_func("/copa/utf8/decoder/decode", test_utf8_decoder_decode);
        g_test_add_func("/copa/utf8/decoder/replacement", test_utf8_decoder_replacement);
        g_test_add_func("/copa/utf8/decoder/reject", test_utf8_decoder_reject);
        g_test_add_func("/copa/utf8/decoder/bounded", test_utf8_decoder_bounded);
        g_test_add_func("/copa/utf8/decoder/flush", test_utf8_decoder_flush);

        return g_test_run();
}
