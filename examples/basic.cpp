#include <canon/normalize.hpp>
#include <canon/utf8.hpp>

#include <iostream>

int main() {
  std::unique_ptr<canon::Normalizer> normalizer;

  auto s = canon::Normalizer::Create(&normalizer);
  if (!s.ok()) {
    std::cerr << "Create failed: " << s.ToString() << "\n";
    return 1;
  }

  // "A" + COMBINING ACUTE ACCENT
  canon::Sequence text = {0x0041, 0x0301};

  canon::Sequence nfc;
  s = normalizer->Normalize(canon::NormalizationMode::kNFC, text, &nfc);
  if (!s.ok()) {
    std::cerr << "Normalize failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "NFC(" << canon::FormatCodePoints(text) << ") = "
            << canon::FormatCodePoints(nfc) << "\n";

  // Compatibility forms fold ligatures.
  std::string nfkc;
  s = normalizer->NormalizeUtf8(canon::NormalizationMode::kNFKC, "\xEF\xAC\x83", &nfkc);
  if (!s.ok()) {
    std::cerr << "NormalizeUtf8 failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "NFKC(U+FB03) = " << nfkc << "\n";

  bool normalized = false;
  s = normalizer->IsNormalized(canon::NormalizationMode::kNFC, text, &normalized);
  if (!s.ok()) {
    std::cerr << "IsNormalized failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "is NFC: " << (normalized ? "yes" : "no") << "\n";

  // Equivalence without normalizing either side up front.
  canon::Ordering order = canon::Ordering::kEqual;
  s = normalizer->CompareUtf8({canon::CompareOption::kIgnoreCase}, "STRASSE", "stra\xC3\x9F" "e",
                              &order);
  if (!s.ok()) {
    std::cerr << "Compare failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "STRASSE vs strasse (ignore case): " << canon::ToString(order) << "\n";

  std::cout << "done\n";
  return 0;
}
