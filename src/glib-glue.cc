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

#include "config.h"

#include "glib-glue.hh"

#include <exception>
#include <new>
#include <string>

#include "debug.hh"

#define COPA_EXCEPTION_ERROR (g_quark_from_static_string("copa-exception-error-quark"))

enum {
        COPA_EXCEPTION_GENERIC,
};

namespace copa::glib {

namespace {

// Appends the message of @e, and those of the exceptions nested in it
void
append_what(std::string& what,
            std::exception const& e)
{
        if (!what.empty())
                what.append(": ");
        what.append(e.what());

        try {
                std::rethrow_if_nested(e);
        } catch (std::exception const& nested) {
                append_what(what, nested);
        } catch (...) {
                what.append(": unknown nested exception");
        }
}

} // anon namespace

bool
set_error_from_exception(GError** error
#if COPA_DEBUG
                         , char const* func
                         , char const* filename
                         , int const line
#endif
                         ) noexcept
try
{
        auto what = std::string{};
        try {
                throw;
        } catch (std::bad_alloc const&) {
                g_error("Out of memory");
        } catch (std::exception const& e) {
                append_what(what, e);
        } catch (...) {
                what = "unknown exception";
        }

#if COPA_DEBUG
        _copa_debug_print(copa::debug::category::EXCEPTIONS,
                          "Caught exception in {} [{}:{}]: {}",
                          func, filename, line, what);
#endif

        auto valid = take_free_ptr(g_utf8_make_valid(what.c_str(), what.size()));
        g_set_error(error, COPA_EXCEPTION_ERROR, COPA_EXCEPTION_GENERIC,
                    "Caught exception: %s", valid.get());
        return false;
}
catch (...)
{
        g_set_error_literal(error, COPA_EXCEPTION_ERROR, COPA_EXCEPTION_GENERIC,
                            "Caught exception while reporting an exception");
        return false;
}

} // namespace copa::glib
