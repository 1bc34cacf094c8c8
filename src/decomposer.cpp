#include <canon/decomposer.hpp>

#include <new>
#include <stdexcept>

#include <canon/internal.hpp>

namespace canon::internal {

namespace {

// Appends the recursive decomposition of c. Keeps counting once dest is full.
rocksdb::Status DecomposeOne(const CharacterDatabase& db,
                             DecompositionKind kind,
                             CodePoint c,
                             size_t depth,
                             CodePoint* dest, size_t capacity,
                             size_t* n) {
  Mapping m;
  rocksdb::Status s = db.Decompose(c, kind, &m);
  if (!s.ok()) return s;

  if (m.empty()) {
    if (*n < capacity) dest[*n] = c;
    ++*n;
    return rocksdb::Status::OK();
  }

  if (depth + 1 >= kMaxDecompositionDepth) {
    return rocksdb::Status::Corruption("decomposition chain too deep at " +
                                       FormatCodePoint(c));
  }
  for (CodePoint part : m) {
    s = DecomposeOne(db, kind, part, depth + 1, dest, capacity, n);
    if (!s.ok()) return s;
  }
  return rocksdb::Status::OK();
}

}  // namespace

rocksdb::Status Decompose(const CharacterDatabase& db,
                          DecompositionKind kind,
                          const CodePoint* src, size_t src_len,
                          CodePoint* dest, size_t capacity,
                          size_t* dest_len) {
  if (!dest_len) return rocksdb::Status::InvalidArgument("dest_len is null");
  if (!dest && capacity > 0) return rocksdb::Status::InvalidArgument("dest is null");

  size_t n = 0;
  for (size_t i = 0; i < src_len; ++i) {
    rocksdb::Status s = DecomposeOne(db, kind, src[i], 0, dest, capacity, &n);
    if (!s.ok()) return s;
  }

  *dest_len = n;
  if (n > capacity) return rocksdb::Status::Incomplete("decomposition needs a larger buffer");
  return rocksdb::Status::OK();
}

rocksdb::Status DecomposeToBuffer(const CharacterDatabase& db,
                                  DecompositionKind kind,
                                  const CodePoint* src, size_t src_len,
                                  size_t initial_capacity,
                                  Sequence* buf,
                                  bool* retried) {
  if (!buf) return rocksdb::Status::InvalidArgument("buf is null");
  if (retried) *retried = false;

  try {
    buf->resize(initial_capacity);
    size_t required = 0;
    rocksdb::Status s = Decompose(db, kind, src, src_len, buf->data(), buf->size(), &required);
    if (s.IsIncomplete()) {
      if (retried) *retried = true;
      buf->resize(required);
      s = Decompose(db, kind, src, src_len, buf->data(), buf->size(), &required);
      if (s.IsIncomplete()) {
        return rocksdb::Status::Aborted("decomposition buffer still too small after retry");
      }
    }
    if (!s.ok()) return s;
    buf->resize(required);
  } catch (const std::bad_alloc&) {
    return rocksdb::Status::MemoryLimit("cannot allocate decomposition buffer");
  } catch (const std::length_error&) {
    return rocksdb::Status::MemoryLimit("decomposition buffer exceeds the maximum size");
  }
  return rocksdb::Status::OK();
}

}  // namespace canon::internal
