#pragma once

#include <cstddef>
#include <cstdint>

#include <rocksdb/status.h>

#include <canon/character_database.hpp>
#include <canon/types.hpp>

namespace canon::internal {

/** Work done by one comparison, for metrics. */
struct CompareStats {
  uint64_t normalized_segments = 0;  // Segments that had to be rewritten
  bool identical = false;            // Inputs were equal code point for code point
};

/**
 * Canonical equivalence comparison.
 *
 * The result is exactly what comparing NFD(a) with NFD(b) element by element
 * would give (NFD(fold(NFD(x))) with kIgnoreCase), but the work is
 * incremental:
 *  - the common raw prefix is skipped up to the last segment boundary both
 *    sides share;
 *  - the rest is produced one segment at a time (a segment starts at a code
 *    point whose lead combining class is 0), so reordering never needs more
 *    than the segment at hand;
 *  - segments that already pass the NFD quick check are compared in place,
 *    FCD segments are decomposed without reordering, and only the others are
 *    decomposed and reordered.
 *
 * With kInputIsFCD the caller promises both inputs are FCD and the local FCD
 * check is skipped. Without kCodePointOrder, code points compare in UTF-16
 * code unit order.
 *
 * Expects scalar values; see Normalizer::Compare for validation.
 */
rocksdb::Status CompareEquivalent(const CharacterDatabase& db,
                                  CompareOptions options,
                                  const CodePoint* a, size_t a_len,
                                  const CodePoint* b, size_t b_len,
                                  Ordering* out,
                                  CompareStats* stats = nullptr);

}  // namespace canon::internal
