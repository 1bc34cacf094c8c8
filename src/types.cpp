#include <canon/types.hpp>

#include <cctype>
#include <string>

namespace canon {

const char* ToString(NormalizationMode mode) {
  switch (mode) {
    case NormalizationMode::kNone: return "None";
    case NormalizationMode::kNFD:  return "NFD";
    case NormalizationMode::kNFKD: return "NFKD";
    case NormalizationMode::kNFC:  return "NFC";
    case NormalizationMode::kNFKC: return "NFKC";
    case NormalizationMode::kFCD:  return "FCD";
  }
  return "Unknown";
}

const char* ToString(CheckResult result) {
  switch (result) {
    case CheckResult::kNo:      return "No";
    case CheckResult::kPerhaps: return "Perhaps";
    case CheckResult::kYes:     return "Yes";
  }
  return "Unknown";
}

const char* ToString(Ordering ordering) {
  switch (ordering) {
    case Ordering::kLess:    return "Less";
    case Ordering::kEqual:   return "Equal";
    case Ordering::kGreater: return "Greater";
  }
  return "Unknown";
}

bool ParseNormalizationMode(std::string_view name, NormalizationMode* out) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  NormalizationMode mode;
  if (lower == "none") {
    mode = NormalizationMode::kNone;
  } else if (lower == "nfd") {
    mode = NormalizationMode::kNFD;
  } else if (lower == "nfkd") {
    mode = NormalizationMode::kNFKD;
  } else if (lower == "nfc") {
    mode = NormalizationMode::kNFC;
  } else if (lower == "nfkc") {
    mode = NormalizationMode::kNFKC;
  } else if (lower == "fcd") {
    mode = NormalizationMode::kFCD;
  } else {
    return false;
  }
  if (out) *out = mode;
  return true;
}

}  // namespace canon
