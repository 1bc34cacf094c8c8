#include <canon/quick_check.hpp>

namespace canon::internal {

namespace {

CheckResult QuickCheckFCD(const CharacterDatabase& db, const CodePoint* data, size_t len) {
  uint8_t prev_tccc = 0;
  for (size_t i = 0; i < len; ++i) {
    const uint8_t lccc = db.LeadCombiningClass(data[i]);
    if (lccc != 0 && prev_tccc > lccc) return CheckResult::kNo;
    prev_tccc = db.TrailCombiningClass(data[i]);
  }
  return CheckResult::kYes;
}

}  // namespace

CheckResult QuickCheck(const CharacterDatabase& db,
                       NormalizationMode mode,
                       const CodePoint* data, size_t len) {
  if (mode == NormalizationMode::kNone) return CheckResult::kYes;
  if (mode == NormalizationMode::kFCD) return QuickCheckFCD(db, data, len);

  CheckResult result = CheckResult::kYes;
  uint8_t last_ccc = 0;
  for (size_t i = 0; i < len; ++i) {
    const uint8_t ccc = db.CombiningClass(data[i]);
    if (ccc != 0 && last_ccc > ccc) return CheckResult::kNo;

    const CheckResult prop = db.QuickCheckProperty(data[i], mode);
    if (prop == CheckResult::kNo) return CheckResult::kNo;
    if (prop == CheckResult::kPerhaps) result = CheckResult::kPerhaps;
    last_ccc = ccc;
  }
  return result;
}

}  // namespace canon::internal
