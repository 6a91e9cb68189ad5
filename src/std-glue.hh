/*
 * Copyright © 2020 Christian Persch
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

namespace copa {

/*
 * Freeable:
 *
 * A std::unique_ptr for C types with a dedicated free function.
 * Declare the free function with COPA_DECLARE_FREEABLE.
 */
template<typename T>
struct FreeableDeleter;

template<typename T>
using Freeable = std::unique_ptr<T, FreeableDeleter<T>>;

template<typename T>
inline Freeable<T>
take_freeable(T* ptr) noexcept
{
        return Freeable<T>{ptr};
}

#define COPA_DECLARE_FREEABLE(T, free_func) \
        template<> \
        struct FreeableDeleter<T> { \
                void operator()(T* ptr) const noexcept { free_func(ptr); } \
        }

/*
 * OptionValue:
 * @S: the type of the destination
 * @V: the type the option parser writes
 *
 * Storage for a GOptionEntry's arg_data. The parsed value is moved
 * into the destination when the OptionValue goes out of scope, so
 * its lifetime must end after the option parser ran.
 */
template<typename S, typename V = S>
class OptionValue {
public:
        OptionValue(S& destination,
                    V initial) noexcept
                : m_destination{destination},
                  m_value{initial}
        {
        }

        ~OptionValue()
        {
                if constexpr (requires { m_destination.reset(m_value); })
                        m_destination.reset(m_value);
                else
                        m_destination = S(m_value);
        }

        OptionValue(OptionValue const&) = delete;
        OptionValue& operator=(OptionValue const&) = delete;

        V* operator&() noexcept { return &m_value; }

private:
        S& m_destination;
        V m_value;

}; // class OptionValue

} // namespace copa
