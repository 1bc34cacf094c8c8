#pragma once

#include <cstddef>

#include <canon/character_database.hpp>
#include <canon/types.hpp>

namespace canon::internal {

/**
 * Canonical ordering algorithm, in place.
 *
 * Each maximal run of code points with a non-zero combining class is
 * stable-sorted by ascending class. Starters (class 0) never move and no mark
 * crosses one. Expects fully decomposed input.
 */
void ReorderCanonical(const CharacterDatabase& db, CodePoint* data, size_t len);

}  // namespace canon::internal
