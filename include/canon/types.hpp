#pragma once

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace canon {

/** A Unicode code point. Scalar values are 0..U+10FFFF minus the surrogates. */
using CodePoint = uint32_t;

/** An ordered run of code points. Always owned by the caller. */
using Sequence = std::vector<CodePoint>;

constexpr CodePoint kMaxCodePoint = 0x10FFFF;

/** Normalization form. */
enum class NormalizationMode {
  kNone,  // Identity
  kNFD,   // Canonical decomposition
  kNFKD,  // Compatibility decomposition
  kNFC,   // Canonical decomposition, then canonical composition
  kNFKC,  // Compatibility decomposition, then canonical composition
  kFCD    // "Fast C or D": ordered raw decomposition, not unique
};

/** Outcome of a quick check. */
enum class CheckResult {
  kNo,       // Definitely not normalized
  kPerhaps,  // Only a full normalize + compare can tell
  kYes       // Definitely normalized
};

/** Three-way comparison result. */
enum class Ordering { kLess = -1, kEqual = 0, kGreater = 1 };

/** Independent flags accepted by Normalizer::Compare. */
enum class CompareOption : uint32_t {
  kInputIsFCD = 1u << 0,              // Caller attests both inputs satisfy FCD
  kCodePointOrder = 1u << 1,          // Code point order instead of UTF-16 order
  kIgnoreCase = 1u << 2,              // Full case folding before comparing
  kFoldCaseExcludeSpecialI = 1u << 3  // Turkic mappings for I and dotted I
};

/**
 * A set of CompareOption flags.
 *
 *   CompareOptions opts{CompareOption::kIgnoreCase, CompareOption::kInputIsFCD};
 */
class CompareOptions {
 public:
  CompareOptions() = default;
  CompareOptions(std::initializer_list<CompareOption> options) {
    for (CompareOption o : options) Set(o);
  }

  bool Has(CompareOption o) const { return (bits_ & static_cast<uint32_t>(o)) != 0; }

  CompareOptions& Set(CompareOption o) {
    bits_ |= static_cast<uint32_t>(o);
    return *this;
  }

  CompareOptions& Clear(CompareOption o) {
    bits_ &= ~static_cast<uint32_t>(o);
    return *this;
  }

  bool empty() const { return bits_ == 0; }

  bool operator==(const CompareOptions& other) const { return bits_ == other.bits_; }
  bool operator!=(const CompareOptions& other) const { return bits_ != other.bits_; }

 private:
  uint32_t bits_ = 0;
};

/** True for 0..U+10FFFF excluding U+D800..U+DFFF. */
inline bool IsScalarValue(CodePoint c) {
  return c <= kMaxCodePoint && (c < 0xD800 || c > 0xDFFF);
}

const char* ToString(NormalizationMode mode);
const char* ToString(CheckResult result);
const char* ToString(Ordering ordering);

/** Accepts "none", "nfd", "nfkd", "nfc", "nfkc", "fcd" in any case. */
bool ParseNormalizationMode(std::string_view name, NormalizationMode* out);

}  // namespace canon
