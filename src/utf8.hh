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

namespace copa::base {

/* UTF8Decoder:
 *
 * An incremental UTF-8 decoder implementing the decoder algorithm of
 * the WHATWG Encoding standard [https://encoding.spec.whatwg.org/#utf-8-decoder].
 * It rejects overlong forms, surrogates and code points above U+10FFFF,
 * and inserts replacement characters for maximal subparts of
 * ill-formed sequences, as recommended by Unicode.
 *
 * At most 3 continuation bytes are ever pending; the decoder
 * never buffers input, only the partially assembled code point.
 */
class UTF8Decoder {
public:
        enum class Result : uint8_t {
                NEED_MORE,     // byte consumed, no code point yet
                ACCEPT,        // byte consumed, codepoint() available
                REJECT,        // byte consumed and is invalid
                REJECT_REWIND, // byte NOT consumed, pending sequence is invalid
        };

        constexpr UTF8Decoder() noexcept = default;
        constexpr ~UTF8Decoder() noexcept = default;

        UTF8Decoder(UTF8Decoder const&) noexcept = default;
        UTF8Decoder(UTF8Decoder&&) noexcept = default;
        UTF8Decoder& operator= (UTF8Decoder const&) = default;
        UTF8Decoder& operator= (UTF8Decoder&&) = default;

        // Returns: the UTF-32 codepoint. This function may only be
        // called after decode() returned ACCEPT, and only once.
        inline constexpr char32_t codepoint() noexcept
        {
                return char32_t(std::exchange(m_codepoint, 0U));
        }

        // Push one byte into the decoder.
        // On ACCEPT, a codepoint is available in .codepoint().
        // On REJECT, the byte could not start a sequence; it has
        // been consumed, and the decoder is ready for the next byte.
        // On REJECT_REWIND, the pending sequence was cut short by
        // this byte, which was NOT consumed and must be pushed again.
        // On NEED_MORE, the byte was consumed but no codepoint has
        // been completely decoded yet.
        inline Result decode(uint8_t byte) noexcept
        {
                if (m_needed == 0) [[likely]] {
                        auto const& lead = kLeadTable[byte];
                        if (lead.needed == 0) [[likely]] {
                                m_codepoint = byte;
                                return Result::ACCEPT;
                        }
                        if (lead.needed == kInvalid) [[unlikely]] {
                                m_codepoint = 0;
                                return Result::REJECT;
                        }

                        m_needed = lead.needed;
                        m_seen = 1;
                        m_lower = lead.lower;
                        m_upper = lead.upper;
                        m_codepoint = byte & lead.mask;
                        return Result::NEED_MORE;
                }

                if (byte < m_lower || byte > m_upper) [[unlikely]] {
                        reset_clear();
                        return Result::REJECT_REWIND;
                }

                m_lower = 0x80;
                m_upper = 0xbf;
                m_codepoint = (m_codepoint << 6) | (byte & 0x3fU);
                ++m_seen;
                if (--m_needed != 0)
                        return Result::NEED_MORE;

                m_seen = 0;
                return Result::ACCEPT;
        }

        // Resets the decoder. A replacement character (U+FFFD)
        // is available in .codepoint() which must be called
        // before more input data is pushed into the decoder.
        inline constexpr void reset_fallback() noexcept
        {
                reset_clear();
                m_codepoint = 0xfffdU;
        }

        // Resets the decoder, discarding any pending sequence.
        inline constexpr void reset_clear() noexcept
        {
                m_codepoint = 0;
                m_needed = 0;
                m_seen = 0;
                m_lower = 0x80;
                m_upper = 0xbf;
        }

        // Flushes pending output of the decoder, and resets it.
        // Returns true if a sequence was pending; in that case a
        // replacement character is available in .codepoint().
        inline constexpr bool flush() noexcept
        {
                auto const pending = in_sequence();
                if (pending)
                        reset_fallback();
                else
                        reset_clear();
                return pending;
        }

        // Returns: whether a multi-byte sequence has been started
        // and is waiting for continuation bytes.
        inline constexpr bool in_sequence() const noexcept { return m_needed != 0; }

        // Returns: the number of bytes of the pending sequence
        // consumed so far.
        inline constexpr unsigned pending() const noexcept { return m_seen; }

        // Returns: the number of continuation bytes still expected
        inline constexpr unsigned needed() const noexcept { return m_needed; }

        // Returns: the length in bytes of the sequence starting with
        // lead byte @byte, or 0 if @byte cannot start a sequence.
        static inline unsigned sequence_length(uint8_t byte) noexcept
        {
                auto const needed = kLeadTable[byte].needed;
                return needed == kInvalid ? 0 : needed + 1;
        }

private:
        struct Lead {
                uint8_t needed;
                uint8_t lower;
                uint8_t upper;
                uint8_t mask;
        };

        static inline constexpr uint8_t const kInvalid = 0xff;

        static std::array<Lead, 256> const kLeadTable;

        uint32_t m_codepoint{0};
        uint8_t m_needed{0};
        uint8_t m_seen{0};
        uint8_t m_lower{0x80};
        uint8_t m_upper{0xbf};

}; // class UTF8Decoder

} // namespace copa::base
