/*
 * Copyright © 2019 Christian Persch
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

#include <memory>

#include <glib.h>

#include "std-glue.hh"

namespace copa::glib {

struct FreeDeleter {
        void operator()(void* ptr) const noexcept { g_free(ptr); }
};

// Owns memory allocated by GLib, and releases it with g_free()
template<typename T>
using FreePtr = std::unique_ptr<T, FreeDeleter>;

template<typename T>
inline FreePtr<T>
take_free_ptr(T* ptr) noexcept
{
        return FreePtr<T>{ptr};
}

struct StrvDeleter {
        void operator()(char** strv) const noexcept { g_strfreev(strv); }
};

using StrvPtr = std::unique_ptr<char*, StrvDeleter>;

/*
 * Error:
 *
 * Owns a GError. Pass it where a GError** is expected.
 */
class Error {
public:
        Error() noexcept = default;
        ~Error() noexcept { g_clear_error(&m_error); }

        Error(Error const&) = delete;
        Error& operator=(Error const&) = delete;

        operator GError** () noexcept { return &m_error; }

        explicit operator bool() const noexcept { return m_error != nullptr; }

        char const* message() const noexcept { return m_error ? m_error->message : "no error"; }

private:
        GError* m_error{nullptr};

}; // class Error

/*
 * set_error_from_exception:
 * @error: a #GError location
 *
 * Sets @error from the exception currently being handled, including
 * any nested exceptions. Only call this from inside a catch block.
 *
 * Returns: %false
 */
bool set_error_from_exception(GError** error
#if COPA_DEBUG
                              , char const* func = __builtin_FUNCTION()
                              , char const* filename = __builtin_FILE()
                              , int const line = __builtin_LINE()
#endif
                              ) noexcept;

} // namespace copa::glib

namespace copa {

COPA_DECLARE_FREEABLE(GArray, g_array_unref);
COPA_DECLARE_FREEABLE(GOptionContext, g_option_context_free);
COPA_DECLARE_FREEABLE(GRand, g_rand_free);
COPA_DECLARE_FREEABLE(GVariant, g_variant_unref);

} // namespace copa
