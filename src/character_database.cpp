#include <canon/character_database.hpp>

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/uversion.h>

#include <canon/internal.hpp>

namespace canon {

namespace {

// Lead and trail classes only need the first/last code point of the full
// decomposition, so follow that edge instead of expanding everything.
template <bool kLead>
uint8_t EdgeCombiningClass(const CharacterDatabase& db, CodePoint c) {
  Mapping m;
  for (size_t depth = 0; depth < internal::kMaxDecompositionDepth; ++depth) {
    if (!db.Decompose(c, DecompositionKind::kCanonical, &m).ok() || m.empty()) {
      break;
    }
    c = kLead ? m.code_points[0] : m.code_points[m.length - 1];
  }
  return db.CombiningClass(c);
}

// Copies the code points of a UTF-16 string into a Mapping.
bool CopyToMapping(const icu::UnicodeString& s, Mapping* out) {
  out->length = 0;
  for (int32_t i = 0; i < s.length();) {
    UChar32 cp = s.char32At(i);
    if (out->length == kMaxMappingLength) return false;
    out->code_points[out->length++] = static_cast<CodePoint>(cp);
    i += U16_LENGTH(cp);
  }
  return true;
}

class IcuCharacterDatabase final : public CharacterDatabase {
 public:
  IcuCharacterDatabase(const icu::Normalizer2* nfd,
                       const icu::Normalizer2* nfkd,
                       const icu::Normalizer2* nfc)
      : nfd_(nfd), nfkd_(nfkd), nfc_(nfc) {}

  rocksdb::Status Decompose(CodePoint c,
                            DecompositionKind kind,
                            Mapping* out) const override {
    out->length = 0;
    const icu::Normalizer2* norm = (kind == DecompositionKind::kCanonical) ? nfd_ : nfkd_;

    icu::UnicodeString raw;
    if (!norm->getRawDecomposition(static_cast<UChar32>(c), raw)) {
      return rocksdb::Status::OK();
    }
    if (!CopyToMapping(raw, out)) {
      out->length = 0;
      return rocksdb::Status::Corruption("decomposition mapping too long for " +
                                         internal::FormatCodePoint(c));
    }
    return rocksdb::Status::OK();
  }

  uint8_t CombiningClass(CodePoint c) const override {
    return u_getCombiningClass(static_cast<UChar32>(c));
  }

  bool Compose(CodePoint a, CodePoint b, CodePoint* composite) const override {
    UChar32 r = nfc_->composePair(static_cast<UChar32>(a), static_cast<UChar32>(b));
    if (r < 0) return false;
    *composite = static_cast<CodePoint>(r);
    return true;
  }

  bool IsFullCompositionExclusion(CodePoint c) const override {
    return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_FULL_COMPOSITION_EXCLUSION);
  }

  CheckResult QuickCheckProperty(CodePoint c, NormalizationMode mode) const override {
    UProperty prop;
    switch (mode) {
      case NormalizationMode::kNFD:  prop = UCHAR_NFD_QUICK_CHECK; break;
      case NormalizationMode::kNFKD: prop = UCHAR_NFKD_QUICK_CHECK; break;
      case NormalizationMode::kNFC:  prop = UCHAR_NFC_QUICK_CHECK; break;
      case NormalizationMode::kNFKC: prop = UCHAR_NFKC_QUICK_CHECK; break;
      default:
        return CheckResult::kYes;
    }
    switch (u_getIntPropertyValue(static_cast<UChar32>(c), prop)) {
      case UNORM_NO:    return CheckResult::kNo;
      case UNORM_MAYBE: return CheckResult::kPerhaps;
      default:          return CheckResult::kYes;
    }
  }

  void CaseFold(CodePoint c, bool exclude_special_i, Mapping* out) const override {
    icu::UnicodeString s(static_cast<UChar32>(c));
    s.foldCase(exclude_special_i ? U_FOLD_CASE_EXCLUDE_SPECIAL_I : U_FOLD_CASE_DEFAULT);
    if (!CopyToMapping(s, out)) {
      // Full folding never exceeds three code points.
      out->code_points[0] = c;
      out->length = 1;
    }
  }

  uint8_t LeadCombiningClass(CodePoint c) const override {
    return static_cast<uint8_t>(
        u_getIntPropertyValue(static_cast<UChar32>(c), UCHAR_LEAD_CANONICAL_COMBINING_CLASS));
  }

  uint8_t TrailCombiningClass(CodePoint c) const override {
    return static_cast<uint8_t>(
        u_getIntPropertyValue(static_cast<UChar32>(c), UCHAR_TRAIL_CANONICAL_COMBINING_CLASS));
  }

  std::string UnicodeVersion() const override {
    UVersionInfo version;
    u_getUnicodeVersion(version);
    char buf[U_MAX_VERSION_STRING_LENGTH];
    u_versionToString(version, buf);
    return buf;
  }

 private:
  // Owned by ICU; never freed.
  const icu::Normalizer2* nfd_;
  const icu::Normalizer2* nfkd_;
  const icu::Normalizer2* nfc_;
};

}  // namespace

uint8_t CharacterDatabase::LeadCombiningClass(CodePoint c) const {
  return EdgeCombiningClass<true>(*this, c);
}

uint8_t CharacterDatabase::TrailCombiningClass(CodePoint c) const {
  return EdgeCombiningClass<false>(*this, c);
}

rocksdb::Status CharacterDatabase::OpenIcu(std::unique_ptr<CharacterDatabase>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
  const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
  const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
  if (U_FAILURE(status) || !nfd || !nfkd || !nfc) {
    return rocksdb::Status::Corruption("ICU normalization data unavailable: ",
                                       u_errorName(status));
  }

  out->reset(new IcuCharacterDatabase(nfd, nfkd, nfc));
  return rocksdb::Status::OK();
}

}  // namespace canon
