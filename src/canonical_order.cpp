#include <canon/canonical_order.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace canon::internal {

void ReorderCanonical(const CharacterDatabase& db, CodePoint* data, size_t len) {
  std::vector<std::pair<uint8_t, CodePoint>> run;

  auto flush = [&](size_t run_end) {
    if (run.size() > 1) {
      std::stable_sort(run.begin(), run.end(),
                       [](const auto& a, const auto& b) { return a.first < b.first; });
      size_t start = run_end - run.size();
      for (size_t k = 0; k < run.size(); ++k) {
        data[start + k] = run[k].second;
      }
    }
    run.clear();
  };

  for (size_t i = 0; i < len; ++i) {
    uint8_t ccc = db.CombiningClass(data[i]);
    if (ccc == 0) {
      flush(i);
    } else {
      run.emplace_back(ccc, data[i]);
    }
  }
  flush(len);
}

}  // namespace canon::internal
