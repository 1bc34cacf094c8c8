#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <rocksdb/status.h>

#include <canon/types.hpp>

namespace canon {

/** Which decomposition mappings to follow. */
enum class DecompositionKind {
  kCanonical,     // Canonical mappings only
  kCompatibility  // Canonical and compatibility mappings
};

// Longest one-level mapping the engine accepts. The longest in the UCD is
// U+FDFA (18 code points, compatibility).
constexpr size_t kMaxMappingLength = 32;

/** A short, fixed-capacity run of code points returned by the database. */
struct Mapping {
  std::array<CodePoint, kMaxMappingLength> code_points{};
  size_t length = 0;

  bool empty() const { return length == 0; }
  const CodePoint* begin() const { return code_points.data(); }
  const CodePoint* end() const { return code_points.data() + length; }
};

/**
 * canon::CharacterDatabase
 *
 * Read-only view of the Unicode character properties the normalization
 * engine needs. Implementations must be immutable once constructed so that
 * one instance can be shared by any number of threads without locking.
 */
class CharacterDatabase {
 public:
  virtual ~CharacterDatabase() = default;

  /**
   * One level of decomposition for c.
   *
   * Leaves out->length == 0 when c has no mapping of the requested kind.
   * With kCanonical, compatibility-only mappings are treated as absent.
   * @return Corruption if the underlying data is inconsistent
   */
  virtual rocksdb::Status Decompose(CodePoint c,
                                    DecompositionKind kind,
                                    Mapping* out) const = 0;

  /** Canonical combining class; 0 for starters. */
  virtual uint8_t CombiningClass(CodePoint c) const = 0;

  /** Primary composite of (a, b), if any. */
  virtual bool Compose(CodePoint a, CodePoint b, CodePoint* composite) const = 0;

  virtual bool IsFullCompositionExclusion(CodePoint c) const = 0;

  /** NFD_QC / NFKD_QC / NFC_QC / NFKC_QC. kNone and kFCD always yield kYes. */
  virtual CheckResult QuickCheckProperty(CodePoint c, NormalizationMode mode) const = 0;

  /** Full case folding of c (at most three code points). */
  virtual void CaseFold(CodePoint c, bool exclude_special_i, Mapping* out) const = 0;

  /** Combining class of the first code point of c's full canonical decomposition. */
  virtual uint8_t LeadCombiningClass(CodePoint c) const;

  /** Combining class of the last code point of c's full canonical decomposition. */
  virtual uint8_t TrailCombiningClass(CodePoint c) const;

  /** Unicode version of the data, e.g. "15.1". */
  virtual std::string UnicodeVersion() const = 0;

  /**
   * Open the ICU-backed database.
   *
   * ICU keeps its normalization data in process-wide singletons, so opening
   * more than one instance is cheap.
   * @return Corruption if ICU's normalization data cannot be loaded
   */
  static rocksdb::Status OpenIcu(std::unique_ptr<CharacterDatabase>* out);
};

}  // namespace canon
