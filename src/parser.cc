/*
 * Copyright © 2015 David Herrmann <dh.herrmann@gmail.com>
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

#include "parser.hh"

#include <algorithm>
#include <array>
#include <cstring>
#include <utility>

#include <simdutf.h>

#include "debug.hh"
#include "parser-fmt.hh"

namespace copa::parser {

using namespace copa::debug;

Parser::Parser() noexcept
{
        _copa_debug_init();
}

/*
 * utf8_length:
 * @c: a Unicode scalar value
 *
 * Returns: the length of the UTF-8 encoding of @c
 */
static inline constexpr size_t
utf8_length(char32_t c) noexcept
{
        return c < 0x80 ? 1 : c < 0x800 ? 2 : c < 0x10000 ? 3 : 4;
}

/*
 * complete_prefix:
 * @data: valid UTF-8
 * @len: the length of @data
 *
 * Returns: the length of the longest prefix of @data that does not
 *   end in the middle of a UTF-8 sequence
 */
static size_t
complete_prefix(uint8_t const* data,
                size_t len) noexcept
{
        for (auto i = len; i > 0 && i + 4 > len; --i) {
                auto const c = data[i - 1];
                if ((c & 0xc0) == 0x80)
                        continue;

                auto const seq_len = base::UTF8Decoder::sequence_length(c);
                return (seq_len != 0 && i - 1 + seq_len <= len) ? len : i - 1;
        }

        return len;
}

void
Parser::advance(Performer& performer,
                std::span<uint8_t const> bytes)
{
        advance_impl<false>(performer, bytes);
}

size_t
Parser::advance_until_terminated(Performer& performer,
                                 std::span<uint8_t const> bytes)
{
        return advance_impl<true>(performer, bytes);
}

void
Parser::reset() noexcept
{
        _copa_debug_print(category::PARSER, "Parser reset in state {}", m_state);

        m_state = State::GROUND;
        m_collector.clear();
        m_osc.reset();
        m_utf8.reset_clear();
        m_string_kind = 0;
}

template<bool check_terminated>
size_t
Parser::advance_impl(Performer& performer,
                     std::span<uint8_t const> bytes)
{
        _COPA_DEBUG_IF(category::IO) {
                _copa_debug_hexdump("Parser input", bytes.data(), bytes.size());
        }

        auto const data = bytes.data();
        auto const len = bytes.size();
        auto i = size_t{0};
        while (i < len) {
                if constexpr (check_terminated) {
                        if (performer.terminated())
                                break;
                }

                if (m_fast_path && m_state == State::GROUND) {
                        auto const n = advance_ground<check_terminated>(performer,
                                                                        data + i,
                                                                        len - i);
                        if (n != 0) {
                                i += n;
                                continue;
                        }
                }

                // A false return means the byte ended an invalid UTF-8
                // sequence and needs to be processed again.
                if (feed(performer, data[i])) [[likely]]
                        ++i;
        }

        return i;
}

/*
 * advance_ground:
 * @performer:
 * @data: the input, starting in ground state
 * @len: the length of @data
 *
 * Dispatches the text at the start of @data, up to the next ESC,
 * using simdutf to validate and decode it. Stops before invalid
 * or incomplete UTF-8, which the scalar decoder handles.
 *
 * Returns: the number of bytes consumed, which may be 0
 */
template<bool check_terminated>
size_t
Parser::advance_ground(Performer& performer,
                       uint8_t const* data,
                       size_t len)
{
        // A byte that cannot start a sequence is left to the scalar decoder
        if (base::UTF8Decoder::sequence_length(data[0]) == 0)
                return 0;

        len = std::min(len, k_fast_path_chunk);
        if (auto const esc = reinterpret_cast<uint8_t const*>(memchr(data, 0x1b, len)))
                len = size_t(esc - data);
        if (len == 0)
                return 0;

        auto const str = reinterpret_cast<char const*>(data);
        if (simdutf::validate_ascii(str, len)) [[likely]] {
                for (auto i = size_t{0}; i < len; ++i) {
                        if constexpr (check_terminated) {
                                if (performer.terminated())
                                        return i;
                        }

                        dispatch(performer, char32_t(data[i]));
                }

                return len;
        }

        auto const result = simdutf::validate_utf8_with_errors(str, len);
        auto const valid = complete_prefix(data,
                                           result.error == simdutf::error_code::SUCCESS ? len : result.count);
        if (valid == 0)
                return 0;

        std::array<char32_t, k_fast_path_chunk> buf;
        auto const n = simdutf::convert_valid_utf8_to_utf32(str, valid, buf.data());

        auto consumed = size_t{0};
        for (auto i = size_t{0}; i < n; ++i) {
                if constexpr (check_terminated) {
                        if (performer.terminated())
                                return consumed;
                }

                auto const c = buf[i];
                consumed += utf8_length(c);
                dispatch(performer, c);
        }

        return valid;
}

/*
 * feed:
 * @performer:
 * @raw: the input byte
 *
 * Runs the transition for @raw. The state is updated before any
 * callback is made.
 *
 * Returns: %false if @raw was not consumed and must be fed again
 */
bool
Parser::feed(Performer& performer,
             uint8_t raw)
{
        auto const [next, action] = transition(m_state, raw);
        if (next == m_state) [[likely]]
                return perform(performer, action, raw);

        auto const prev = std::exchange(m_state, next);
        _copa_debug_print(category::PARSER, "{} -> {} on {:#04x}", prev, next, raw);

        perform(performer, exit_action(prev), raw);
        perform(performer, action, raw);
        perform(performer, entry_action(next), raw);
        return true;
}

bool
Parser::perform(Performer& performer,
                Action action,
                uint8_t raw)
{
        switch (action) {
                using enum Action;
        case NONE:
        case IGNORE:
                break;

        case PRINT:
                performer.print(char32_t(raw));
                break;

        case EXECUTE:
                performer.execute(raw);
                break;

        case CLEAR:
                m_collector.clear();
                break;

        case COLLECT:
                m_collector.push_intermediate(raw);
                break;

        case PARAM:
                m_collector.push_param_digit(raw);
                break;

        case PARAM_SEPARATOR:
                m_collector.push_param_separator(false);
                break;

        case SUBPARAM_SEPARATOR:
                m_collector.push_param_separator(true);
                break;

        case ESC_DISPATCH:
                performer.esc_dispatch(m_collector.intermediates(),
                                       m_collector.ignore(),
                                       char(raw));
                break;

        case CSI_DISPATCH:
                m_collector.finish();
                _copa_debug_print(category::PARAMS, "CSI {} {} {:c}",
                                  m_collector.params(),
                                  m_collector.intermediates(),
                                  char(raw));
                performer.csi_dispatch(m_collector.params(),
                                       m_collector.intermediates(),
                                       m_collector.ignore(),
                                       char(raw));
                break;

        case HOOK:
                m_collector.finish();
                _copa_debug_print(category::PARAMS, "DCS {} {} {:c}",
                                  m_collector.params(),
                                  m_collector.intermediates(),
                                  char(raw));
                performer.hook(m_collector.params(),
                               m_collector.intermediates(),
                               m_collector.ignore(),
                               char(raw));
                break;

        case PUT:
                performer.put(raw);
                break;

        case UNHOOK:
                performer.unhook();
                break;

        case OSC_START:
                m_osc.reset();
                break;

        case OSC_PUT:
                if (!m_osc.push(raw)) [[unlikely]] {
                        _copa_debug_print(category::OSC, "OSC payload overflow at {} bytes",
                                          m_osc.size());
                }
                break;

        case OSC_END:
                osc_end(performer, raw);
                break;

        case STRING_START:
                string_start(performer, raw);
                break;

        case STRING_PUT:
                string_put(performer, raw);
                break;

        case STRING_END:
                string_end(performer);
                break;

        case UTF8:
                return feed_utf8(performer, raw);
        }

        return true;
}

/*
 * feed_utf8:
 * @performer:
 * @raw: a byte in ground or continuation state
 *
 * Returns: %false if @raw was not consumed and must be fed again
 */
bool
Parser::feed_utf8(Performer& performer,
                  uint8_t raw)
{
        switch (m_utf8.decode(raw)) {
                using enum base::UTF8Decoder::Result;
        case NEED_MORE:
                m_state = State::UTF8_CONTINUATION;
                return true;

        case ACCEPT:
                m_state = State::GROUND;
                dispatch(performer, m_utf8.codepoint());
                return true;

        case REJECT:
                m_state = State::GROUND;
                // A lone C1 control
                if (raw < 0xa0) {
                        performer.execute(raw);
                } else {
                        _copa_debug_print(category::UTF8, "Invalid UTF-8 lead byte {:#04x}", raw);
                        performer.print(char32_t(0xfffd));
                }
                return true;

        case REJECT_REWIND:
                m_state = State::GROUND;
                _copa_debug_print(category::UTF8, "Incomplete UTF-8 sequence before {:#04x}", raw);
                performer.print(char32_t(0xfffd));
                return false;
        }

        g_assert_not_reached();
        return true;
}

void
Parser::osc_end(Performer& performer,
                uint8_t raw)
{
        if (m_osc.overflowed()) [[unlikely]] {
                _copa_debug_print(category::OSC, "Dropping overflowed OSC of {} bytes",
                                  m_osc.size());
                m_osc.reset();
                return;
        }

        auto const fields = OscFields{m_osc.string_view()};
        _copa_debug_print(category::OSC, "OSC {} bell:{}", fields, raw == 0x07);
        performer.osc_dispatch(fields, raw == 0x07);
        m_osc.reset();
}

void
Parser::string_start(Performer& performer,
                     uint8_t raw)
{
        m_string_kind = raw;
        switch (raw) {
        case 'X': performer.sos_start(); break;
        case '^': performer.pm_start(); break;
        case '_': performer.apc_start(); break;
        default: g_assert_not_reached();
        }
}

void
Parser::string_put(Performer& performer,
                   uint8_t raw)
{
        switch (m_string_kind) {
        case 'X': performer.sos_put(raw); break;
        case '^': performer.pm_put(raw); break;
        case '_': performer.apc_put(raw); break;
        default: g_assert_not_reached();
        }
}

void
Parser::string_end(Performer& performer)
{
        switch (std::exchange(m_string_kind, 0)) {
        case 'X': performer.sos_end(); break;
        case '^': performer.pm_end(); break;
        case '_': performer.apc_end(); break;
        default: g_assert_not_reached();
        }
}

} // namespace copa::parser
