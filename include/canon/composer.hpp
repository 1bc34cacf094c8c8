#pragma once

#include <cstddef>

#include <canon/character_database.hpp>
#include <canon/types.hpp>

namespace canon::internal {

/**
 * Canonical composition algorithm (UAX #15), in place.
 *
 * Expects decomposed, canonically ordered input. A code point C combines with
 * the last starter S when nothing between them blocks it: C is adjacent to S,
 * or the code point just before C is a mark with a class lower than C's.
 * Nothing composes when the starter, the candidate or the composite is a full
 * composition exclusion.
 *
 * @return The composed length (<= len); data[0..return) holds the result
 */
size_t ComposeCanonical(const CharacterDatabase& db, CodePoint* data, size_t len);

}  // namespace canon::internal
