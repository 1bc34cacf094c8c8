#pragma once

#include <cstddef>

#include <rocksdb/status.h>

#include <canon/character_database.hpp>
#include <canon/types.hpp>

namespace canon::internal {

/**
 * Fully decompose src into dest.
 *
 * Every code point is replaced by its recursive decomposition of the given
 * kind; code points without a mapping (including values outside the scalar
 * range) pass through unchanged. The output is not reordered.
 *
 * Writes at most capacity code points. *dest_len always receives the exact
 * length of the full decomposition, so a caller whose buffer was too small
 * learns the size it needs.
 *
 * @return OK, Incomplete if capacity < *dest_len, or Corruption if a
 *         decomposition chain exceeds kMaxDecompositionDepth
 */
rocksdb::Status Decompose(const CharacterDatabase& db,
                          DecompositionKind kind,
                          const CodePoint* src, size_t src_len,
                          CodePoint* dest, size_t capacity,
                          size_t* dest_len);

/**
 * Decompose into a growable buffer using the two-phase discipline:
 * one attempt at initial_capacity, then exactly one retry at the size the
 * first attempt reported. On success buf->size() is the decomposed length.
 *
 * @param retried Optional: set to true if the retry was needed
 * @return OK, Corruption from Decompose, Aborted if the retry also comes up
 *         short, MemoryLimit if the buffer cannot be allocated
 */
rocksdb::Status DecomposeToBuffer(const CharacterDatabase& db,
                                  DecompositionKind kind,
                                  const CodePoint* src, size_t src_len,
                                  size_t initial_capacity,
                                  Sequence* buf,
                                  bool* retried = nullptr);

}  // namespace canon::internal
