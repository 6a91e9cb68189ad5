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

#include <optional>

#include <glib.h>

#include "glib-glue.hh"
#include "parser-collector.hh"
#include "parser-table.hh"
#include "std-glue.hh"

namespace copa::parser {

/*
 * to_variant:
 *
 * Serializes parameters as an "ai" of the encoded slots, which
 * carries the default and nonfinal flags along with the values.
 *
 * Returns: a new (non-floating) #GVariant
 */
copa::Freeable<GVariant> to_variant(Params const& params);

// Serializes intermediates as an "ay".
copa::Freeable<GVariant> to_variant(Intermediates const& intermediates);

// Serializes a state as a "y".
copa::Freeable<GVariant> to_variant(State state);

/*
 * params_from_variant:
 * @variant: a #GVariant of type "ai"
 *
 * Returns: the parameters, or nullopt if @variant has the wrong type
 *   or too many elements
 */
std::optional<Params> params_from_variant(GVariant* variant) noexcept;

std::optional<Intermediates> intermediates_from_variant(GVariant* variant) noexcept;

std::optional<State> state_from_variant(GVariant* variant) noexcept;

} // namespace copa::parser
