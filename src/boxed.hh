// Copyright © 2025 Christian Persch
// Copyright © 2026 the copa authors
//
// This library is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published
// by the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This library is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this library.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

namespace copa {

// Wraps a @T value in a distinct type, so that it can have its own
// fmt::formatter. @Tag tells apart boxes of the same @T.
template<typename T,
         typename Tag = void>
class boxed {
public:
        using element_type = T;

        constexpr boxed() noexcept = default;
        explicit constexpr boxed(T v) noexcept : m_value{v} { }

        constexpr T const& get() const noexcept { return m_value; }

private:
        T m_value{};

}; // class boxed

} // namespace copa
