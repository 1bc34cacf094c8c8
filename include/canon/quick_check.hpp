#pragma once

#include <cstddef>

#include <canon/character_database.hpp>
#include <canon/types.hpp>

namespace canon::internal {

/**
 * Single-pass quick check, never decomposes.
 *
 * NFD/NFKD/NFC/NFKC: No as soon as a code point's quick-check property is No
 * or a mark follows a mark of higher class; Perhaps if any property was Maybe;
 * otherwise Yes. Only the composed forms have Maybe values.
 *
 * FCD: No if some code point's lead class is non-zero and lower than the
 * previous code point's trail class, otherwise Yes.
 *
 * kNone is always Yes.
 */
CheckResult QuickCheck(const CharacterDatabase& db,
                       NormalizationMode mode,
                       const CodePoint* data, size_t len);

}  // namespace canon::internal
