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

#include "parser-string.hh"

#include <initializer_list>
#include <string_view>

#include <glib.h>

using namespace std::literals;
using namespace copa::parser;

template<class P>
static void
fill(P& payload,
     size_t n,
     uint8_t c = 'x')
{
        for (auto i = size_t{0}; i < n; ++i)
                g_assert_true(payload.push(c));
}

static void
test_payload_growable(void)
{
        auto payload = GrowablePayload{};
        g_assert_cmpuint(payload.size(), ==, 0);
        g_assert_cmpuint(payload.capacity(), ==, GrowablePayload::k_default_capacity);

        fill(payload, GrowablePayload::k_default_capacity + 1);
        g_assert_cmpuint(payload.size(), ==, GrowablePayload::k_default_capacity + 1);
        g_assert_cmpuint(payload.capacity(), ==, 2 * GrowablePayload::k_default_capacity);
        g_assert_false(payload.overflowed());

        auto const capacity = payload.capacity();
        payload.reset();
        g_assert_cmpuint(payload.size(), ==, 0);
        g_assert_cmpuint(payload.capacity(), ==, capacity);
        g_assert_true(payload.string_view().empty());

        payload.push('a');
        payload.push(';');
        payload.push('b');
        g_assert_true(payload.string_view() == "a;b"sv);
}

static void
test_payload_growable_overflow(void)
{
        auto payload = GrowablePayload{};
        fill(payload, GrowablePayload::k_max_capacity);
        g_assert_cmpuint(payload.capacity(), ==, GrowablePayload::k_max_capacity);
        g_assert_false(payload.overflowed());

        g_assert_false(payload.push('y'));
        g_assert_true(payload.overflowed());
        g_assert_cmpuint(payload.size(), ==, GrowablePayload::k_max_capacity);

        // Stays overflowed until reset
        payload.reset();
        g_assert_false(payload.overflowed());
        g_assert_true(payload.push('y'));
}

static void
test_payload_growable_copy(void)
{
        auto payload = GrowablePayload{};
        fill(payload, 200, 'q');

        auto copy = GrowablePayload{payload};
        payload.reset();
        g_assert_cmpuint(copy.size(), ==, 200);
        g_assert_cmpuint(copy.string_view().find_first_not_of('q'), ==, std::string_view::npos);
}

static void
test_payload_fixed(void)
{
        auto payload = FixedPayload<8>{};
        g_assert_cmpuint(payload.capacity(), ==, 8);

        fill(payload, 8, 'z');
        g_assert_false(payload.overflowed());
        g_assert_true(payload.string_view() == "zzzzzzzz"sv);

        g_assert_false(payload.push('z'));
        g_assert_true(payload.overflowed());
        g_assert_cmpuint(payload.size(), ==, 8);

        payload.reset();
        g_assert_false(payload.overflowed());
        g_assert_cmpuint(payload.size(), ==, 0);
}

static void
assert_fields(std::string_view payload,
              std::initializer_list<std::string_view> expected)
{
        auto const fields = OscFields{payload};
        g_assert_cmpuint(fields.size(), ==, expected.size());

        auto i = 0u;
        for (auto const& field : expected)
                g_assert_true(fields[i++] == field);
}

static void
test_osc_fields_split(void)
{
        assert_fields(""sv, {""sv});
        assert_fields("0"sv, {"0"sv});
        assert_fields("0;hello"sv, {"0"sv, "hello"sv});
        assert_fields(";"sv, {""sv, ""sv});
        assert_fields("8;;https://example.com"sv, {"8"sv, ""sv, "https://example.com"sv});
        assert_fields("52;c;YWJj"sv, {"52"sv, "c"sv, "YWJj"sv});
        assert_fields("2;t\xc3\xa4st"sv, {"2"sv, "t\xc3\xa4st"sv});
}

static void
test_osc_fields_max(void)
{
        // 16 fields are kept
        assert_fields("0;1;2;3;4;5;6;7;8;9;a;b;c;d;e;f"sv,
                      {"0"sv, "1"sv, "2"sv, "3"sv, "4"sv, "5"sv, "6"sv, "7"sv,
                       "8"sv, "9"sv, "a"sv, "b"sv, "c"sv, "d"sv, "e"sv, "f"sv});

        // anything after the 16th separator is dropped
        assert_fields("0;1;2;3;4;5;6;7;8;9;a;b;c;d;e;f;g;h"sv,
                      {"0"sv, "1"sv, "2"sv, "3"sv, "4"sv, "5"sv, "6"sv, "7"sv,
                       "8"sv, "9"sv, "a"sv, "b"sv, "c"sv, "d"sv, "e"sv, "f"sv});

        auto const fields = OscFields{"a;b"sv};
        g_assert_true(fields[2].empty());
        g_assert_true(fields[OscFields::k_max].empty());
}

static void
test_osc_fields_number(void)
{
        auto const fields = OscFields{"0;;65535;65536;12a;-1;4"sv};

        g_assert_cmpint(*fields.number(0), ==, 0);
        g_assert_cmpint(*fields.number(1), ==, -1);
        g_assert_cmpint(*fields.number(2), ==, 65535);
        g_assert_false(fields.number(3).has_value());
        g_assert_false(fields.number(4).has_value());
        g_assert_false(fields.number(5).has_value());
        g_assert_cmpint(*fields.number(6), ==, 4);
        g_assert_false(fields.number(7).has_value());
}

static void
test_osc_fields_bytes(void)
{
        auto const fields = OscFields{"1;\xff\xfe"sv};
        auto const bytes = fields.bytes(1);
        g_assert_cmpuint(bytes.size(), ==, 2);
        g_assert_cmpuint(bytes[0], ==, 0xff);
        g_assert_cmpuint(bytes[1], ==, 0xfe);
}

int
main(int argc,
     char* argv[])
{
        g_test_init(&argc, &argv, nullptr);

        g_test_add_func("/copa/parser/payload/growable", test_payload_growable);
        g_test_add_func("/copa/parser/payload/growable/overflow", test_payload_growable_overflow);
        g_test_add_func("/copa/parser/payload/growable/copy", test_payload_growable_copy);
        g_test_add_func("/copa/parser/payload/fixed", test_payload_fixed);
        g_test_add_func("/copa/parser/osc-fields/split", test_osc_fields_split);
        g_test_add_func("/copa/parser/osc-fields/max", test_osc_fields_max);
        g_test_add_func("/copa/parser/osc-fields/number", test_osc_fields_number);
        g_test_add_func("/copa/parser/osc-fields/bytes", test_osc_fields_bytes);

        return g_test_run();
}
