/*
 * Copyright (C) 2002 Red Hat, Inc.
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

/* The interfaces in this file are subject to change at any time. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

#include <glib.h>

#if COPA_DEBUG
#include <fmt/format.h>
#endif

namespace copa::debug {

enum class category : unsigned {
        NONE          = 0,
        ALL           = ~0u,
        MISC          = 1u << 0,
        PARSER        = 1u << 1,
        IO            = 1u << 2,
        UTF8          = 1u << 3,
        PARAMS        = 1u << 4,
        OSC           = 1u << 5,
        EXCEPTIONS    = 1u << 30,
};

inline constexpr category
operator&(category lhs,
          category rhs) noexcept
{
        return category(std::to_underlying(lhs) & std::to_underlying(rhs));
}

inline constexpr category
operator|(category lhs,
          category rhs) noexcept
{
        return category(std::to_underlying(lhs) | std::to_underlying(rhs));
}

#if COPA_DEBUG
inline category debug_categories = category::NONE;
#endif

static inline bool
check_categories(category cats)
{
#if COPA_DEBUG
        return (debug_categories & cats) != category::NONE;
#else
        return false;
#endif
}

#if COPA_DEBUG

namespace detail {

static inline void
log(fmt::string_view fmt,
    fmt::format_args args)
{
        fmt::vprintln(stderr, fmt, args);
}

} // namespace detail

template<typename... T>
static inline void
println(fmt::format_string<T...> fmt,
        T&&... args) noexcept
try
{
        detail::log(fmt, fmt::make_format_args(args...));
}
catch (...)
{
}

#endif // COPA_DEBUG

} // namespace copa::debug

void _copa_debug_init(void);

void _copa_debug_hexdump(char const* str,
                         uint8_t const* buf,
                         size_t len);

#if COPA_DEBUG
#define _COPA_DEBUG_IF(cats) if (copa::debug::check_categories(cats)) [[unlikely]]
#else
#define _COPA_DEBUG_IF(cats) if constexpr (false)
#endif

#if COPA_DEBUG
#define _copa_debug_print(cats, ...) \
        G_STMT_START { _COPA_DEBUG_IF(cats) { \
                        copa::debug::println(__VA_ARGS__); \
                } \
        } G_STMT_END
#else
#define _copa_debug_print(...) do { } while(0)
#endif // COPA_DEBUG
