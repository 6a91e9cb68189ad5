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

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include <glib.h>

#include <fast_float/fast_float.h>

#include "glib-glue.hh"

#define COPA_SEQ_STRING_DEFAULT_CAPACITY (1 << 7) /* must be power of two */
#define COPA_SEQ_STRING_MAX_CAPACITY     (1 << 20)

#define COPA_OSC_FIELDS_MAX (16)

namespace copa::parser {

/*
 * GrowablePayload:
 *
 * Holds the raw bytes of an OSC string. The storage starts small
 * and doubles on demand up to COPA_SEQ_STRING_MAX_CAPACITY bytes.
 */
class GrowablePayload {
public:
        static inline constexpr auto const k_default_capacity = size_t{COPA_SEQ_STRING_DEFAULT_CAPACITY};
        static inline constexpr auto const k_max_capacity = size_t{COPA_SEQ_STRING_MAX_CAPACITY};

        GrowablePayload() noexcept
                : m_buf{reinterpret_cast<uint8_t*>(g_malloc(k_default_capacity))},
                  m_capacity{k_default_capacity}
        {
        }

        ~GrowablePayload() noexcept = default;

        GrowablePayload(GrowablePayload const& other) noexcept
                : m_buf{reinterpret_cast<uint8_t*>(g_memdup2(other.m_buf.get(), other.m_capacity))},
                  m_capacity{other.m_capacity},
                  m_len{other.m_len},
                  m_overflow{other.m_overflow}
        {
        }

        GrowablePayload(GrowablePayload&&) = delete;
        GrowablePayload& operator=(GrowablePayload const&) = delete;
        GrowablePayload& operator=(GrowablePayload&&) = delete;

        /*
         * push:
         * @c: a byte
         *
         * Appends @c, or iff the payload already has maximum length,
         * marks it as overflowed.
         *
         * Returns: %true if the byte was appended
         */
        inline bool push(uint8_t c) noexcept
        {
                if (m_overflow || !ensure_capacity()) [[unlikely]] {
                        m_overflow = true;
                        return false;
                }

                m_buf.get()[m_len++] = c;
                return true;
        }

        /*
         * reset:
         *
         * Empties the payload and clears the overflow mark. Does not
         * shrink the capacity.
         */
        inline void reset() noexcept
        {
                m_len = 0;
                m_overflow = false;
        }

        inline constexpr size_t size() const noexcept { return m_len; }
        inline constexpr size_t capacity() const noexcept { return m_capacity; }
        inline constexpr bool overflowed() const noexcept { return m_overflow; }

        inline std::string_view string_view() const noexcept
        {
                return {reinterpret_cast<char const*>(m_buf.get()), m_len};
        }

private:
        glib::FreePtr<uint8_t> m_buf;
        size_t m_capacity{0};
        size_t m_len{0};
        bool m_overflow{false};

        /*
         * ensure_capacity:
         *
         * If the payload is at capacity, and capacity is not maximal,
         * expands the capacity.
         *
         * Returns: %true if the payload has room for at least one more byte
         */
        inline bool ensure_capacity() noexcept
        {
                if (m_len < m_capacity) [[likely]]
                        return true;
                if (m_capacity >= k_max_capacity)
                        return false;

                m_capacity *= 2;
                m_buf.reset(reinterpret_cast<uint8_t*>(g_realloc_n(m_buf.release(), m_capacity, 1)));
                return true;
        }

}; // class GrowablePayload

/*
 * FixedPayload:
 *
 * Like GrowablePayload, but with inline storage of @N bytes and
 * no allocation.
 */
template<size_t N>
class FixedPayload {
public:
        static_assert(N > 0, "payload capacity must not be zero");

        static inline constexpr auto const k_max_capacity = N;

        constexpr FixedPayload() noexcept = default;

        inline constexpr bool push(uint8_t c) noexcept
        {
                if (m_overflow || m_len == N) [[unlikely]] {
                        m_overflow = true;
                        return false;
                }

                m_buf[m_len++] = c;
                return true;
        }

        inline constexpr void reset() noexcept
        {
                m_len = 0;
                m_overflow = false;
        }

        inline constexpr size_t size() const noexcept { return m_len; }
        inline constexpr size_t capacity() const noexcept { return N; }
        inline constexpr bool overflowed() const noexcept { return m_overflow; }

        inline std::string_view string_view() const noexcept
        {
                return {reinterpret_cast<char const*>(m_buf.data()), m_len};
        }

private:
        std::array<uint8_t, N> m_buf{};
        size_t m_len{0};
        bool m_overflow{false};

}; // class FixedPayload

#if COPA_OSC_FIXED_BUFFER
using OscPayload = FixedPayload<COPA_OSC_BUFFER_SIZE>;
#else
using OscPayload = GrowablePayload;
#endif

/*
 * OscFields:
 *
 * The ';'-separated fields of an OSC payload. At most
 * COPA_OSC_FIELDS_MAX fields are kept; everything from the
 * separator that would start the next field on is dropped.
 *
 * The fields point into the payload, so an OscFields must not
 * outlive the payload it was split from.
 */
class OscFields {
public:
        static inline constexpr auto const k_max = unsigned{COPA_OSC_FIELDS_MAX};

        constexpr OscFields() noexcept = default;

        explicit OscFields(std::string_view payload) noexcept
        {
                split(payload);
        }

        inline constexpr unsigned size() const noexcept { return m_n_fields; }
        inline constexpr bool empty() const noexcept { return m_n_fields == 0; }

        inline constexpr auto begin() const noexcept { return m_fields.begin(); }
        inline constexpr auto end() const noexcept { return m_fields.begin() + m_n_fields; }

        // Returns: the field @idx, or an empty view if @idx is out of range
        inline constexpr std::string_view operator[](unsigned idx) const noexcept
        {
                return idx < m_n_fields ? m_fields[idx] : std::string_view{};
        }

        inline std::span<uint8_t const> bytes(unsigned idx) const noexcept
        {
                auto const field = (*this)[idx];
                return {reinterpret_cast<uint8_t const*>(field.data()), field.size()};
        }

        /*
         * number:
         * @idx: the field index
         *
         * Parses field @idx as a decimal number.
         *
         * Returns: the number, -1 for an empty field, or nullopt if
         *   the field could not be parsed as a number, or the parsed
         *   value exceeds the uint16_t range
         */
        std::optional<int> number(unsigned idx) const noexcept
        {
                if (idx >= m_n_fields)
                        return std::nullopt;

                auto const str = m_fields[idx];
                if (str.empty())
                        return -1;

                auto value = uint16_t{0};
                if (auto [ptr, err] = fast_float::from_chars(std::begin(str),
                                                             std::end(str),
                                                             value);
                    err == std::errc() && ptr == std::end(str)) {
                        return int(value);
                }

                return std::nullopt;
        }

private:
        std::array<std::string_view, k_max> m_fields{};
        unsigned m_n_fields{0};

        void split(std::string_view payload) noexcept
        {
                auto start = size_t{0};
                while (m_n_fields < k_max) {
                        auto const pos = payload.find(';', start);
                        if (pos == payload.npos) {
                                m_fields[m_n_fields++] = payload.substr(start);
                                break;
                        }

                        m_fields[m_n_fields++] = payload.substr(start, pos - start);
                        start = pos + 1;
                }
        }

}; // class OscFields

} // namespace copa::parser
