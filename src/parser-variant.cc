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

#include "parser-variant.hh"

#include <utility>
#include <vector>

namespace copa::parser {

static inline auto
take_variant(GVariant* variant)
{
        return copa::take_freeable(g_variant_ref_sink(variant));
}

copa::Freeable<GVariant>
to_variant(Params const& params)
{
        auto values = std::vector<int32_t>{};
        values.reserve(params.size());
        for (auto i = 0u; i < params.size(); ++i)
                values.push_back(params.arg(i).encoded());

        return take_variant(g_variant_new_fixed_array(G_VARIANT_TYPE_INT32,
                                                      values.data(),
                                                      values.size(),
                                                      sizeof(int32_t)));
}

copa::Freeable<GVariant>
to_variant(Intermediates const& intermediates)
{
        auto const bytes = intermediates.bytes();
        return take_variant(g_variant_new_fixed_array(G_VARIANT_TYPE_BYTE,
                                                      bytes.data(),
                                                      bytes.size(),
                                                      sizeof(uint8_t)));
}

copa::Freeable<GVariant>
to_variant(State state)
{
        return take_variant(g_variant_new_byte(std::to_underlying(state)));
}

std::optional<Params>
params_from_variant(GVariant* variant) noexcept
{
        if (!variant || !g_variant_is_of_type(variant, G_VARIANT_TYPE("ai")))
                return std::nullopt;

        auto n = gsize{0};
        auto const values = reinterpret_cast<int32_t const*>
                (g_variant_get_fixed_array(variant, &n, sizeof(int32_t)));
        if (n > Params::k_max)
                return std::nullopt;

        auto params = Params{};
        for (auto i = gsize{0}; i < n; ++i)
                params.push(Arg::from_encoded(values[i]));

        return params;
}

std::optional<Intermediates>
intermediates_from_variant(GVariant* variant) noexcept
{
        if (!variant || !g_variant_is_of_type(variant, G_VARIANT_TYPE_BYTESTRING))
                return std::nullopt;

        auto n = gsize{0};
        auto const bytes = reinterpret_cast<uint8_t const*>
                (g_variant_get_fixed_array(variant, &n, sizeof(uint8_t)));

        auto intermediates = Intermediates{};
        for (auto i = gsize{0}; i < n; ++i) {
                if (!intermediates.push(bytes[i]))
                        return std::nullopt;
        }

        return intermediates;
}

std::optional<State>
state_from_variant(GVariant* variant) noexcept
{
        if (!variant || !g_variant_is_of_type(variant, G_VARIANT_TYPE_BYTE))
                return std::nullopt;

        auto const v = g_variant_get_byte(variant);
        if (v >= k_n_states)
                return std::nullopt;

        return State(v);
}

} // namespace copa::parser
