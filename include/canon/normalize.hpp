#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

#include <canon/character_database.hpp>
#include <canon/options.hpp>
#include <canon/types.hpp>

namespace canon {

/**
 * canon::Normalizer
 *
 * Unicode normalization over code point sequences:
 * - Normalize(mode, text) rewrites text into NFD, NFKD, NFC, NFKC or FCD.
 * - QuickCheck / IsNormalized answer whether text already is in a form.
 * - Compare orders two texts by canonical equivalence.
 *
 * Pipelines:
 *   NFD  = decompose(canonical) -> reorder
 *   NFKD = decompose(compat)    -> reorder
 *   NFC  = decompose(canonical) -> reorder -> compose
 *   NFKC = decompose(compat)    -> reorder -> compose
 *   FCD  = input if it already passes the FCD check, else NFD
 *
 * A Normalizer holds no mutable state; all methods are const and may be
 * called concurrently from any number of threads.
 */
class Normalizer {
 public:
  ~Normalizer();

  Normalizer(const Normalizer&) = delete;
  Normalizer& operator=(const Normalizer&) = delete;

  /**
   * Create a normalizer.
   *
   * Opens the ICU character database unless opt.database is set.
   * @return InvalidArgument for bad options, Corruption if ICU data is missing
   */
  static rocksdb::Status Create(std::unique_ptr<Normalizer>* out,
                                const Options& opt = Options{});

  /**
   * Normalize text into the given form.
   *
   * @param out Receives the result; untouched unless OK is returned
   * @return InvalidArgument if text holds a value that is not a Unicode
   *         scalar value; Aborted/MemoryLimit/Corruption on fatal failures
   */
  rocksdb::Status Normalize(NormalizationMode mode,
                            const Sequence& text,
                            Sequence* out) const;

  /** Single-pass heuristic; never decomposes and never fails. */
  CheckResult QuickCheck(NormalizationMode mode, const Sequence& text) const;

  /**
   * Exact normalization check: the quick check, falling back to
   * normalize-and-compare when it says Perhaps.
   */
  rocksdb::Status IsNormalized(NormalizationMode mode,
                               const Sequence& text,
                               bool* out) const;

  /**
   * Compare a and b by canonical equivalence.
   *
   * Equal iff NFD(a) == NFD(b) (after full case folding with kIgnoreCase).
   * Otherwise orders by the first differing code point of those forms.
   */
  rocksdb::Status Compare(CompareOptions options,
                          const Sequence& a,
                          const Sequence& b,
                          Ordering* out) const;

  // UTF-8 conveniences. Malformed UTF-8 is InvalidArgument.
  rocksdb::Status NormalizeUtf8(NormalizationMode mode,
                                std::string_view text,
                                std::string* out) const;
  rocksdb::Status IsNormalizedUtf8(NormalizationMode mode,
                                   std::string_view text,
                                   bool* out) const;
  rocksdb::Status CompareUtf8(CompareOptions options,
                              std::string_view a,
                              std::string_view b,
                              Ordering* out) const;

  const CharacterDatabase& database() const { return *db_; }
  const Options& options() const { return opt_; }

 private:
  explicit Normalizer(const Options& opt);

  rocksdb::Status NormalizeImpl(NormalizationMode mode,
                                const Sequence& text,
                                Sequence* out) const;

  Options opt_;
  std::shared_ptr<const CharacterDatabase> db_;
};

}  // namespace canon
