#include <canon/composer.hpp>

namespace canon::internal {

size_t ComposeCanonical(const CharacterDatabase& db, CodePoint* data, size_t len) {
  if (len == 0) return 0;

  // The write index never passes the read index, so composing in place is safe.
  size_t out = 0;
  bool have_starter = false;
  size_t starter = 0;
  uint8_t last_ccc = 0;  // class of data[out - 1]

  for (size_t i = 0; i < len; ++i) {
    const CodePoint c = data[i];
    const uint8_t ccc = db.CombiningClass(c);

    if (have_starter) {
      const bool adjacent = (out == starter + 1);
      const bool blocked = !adjacent && (last_ccc == 0 || last_ccc >= ccc);
      CodePoint composite = 0;
      if (!blocked && !db.IsFullCompositionExclusion(data[starter]) &&
          !db.IsFullCompositionExclusion(c) &&
          db.Compose(data[starter], c, &composite) &&
          !db.IsFullCompositionExclusion(composite)) {
        data[starter] = composite;
        continue;
      }
    }

    if (ccc == 0) {
      have_starter = true;
      starter = out;
    }
    last_ccc = ccc;
    data[out++] = c;
  }
  return out;
}

}  // namespace canon::internal
