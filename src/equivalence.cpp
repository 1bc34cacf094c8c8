#include <canon/equivalence.hpp>

#include <algorithm>

#include <canon/canonical_order.hpp>
#include <canon/decomposer.hpp>
#include <canon/internal.hpp>
#include <canon/quick_check.hpp>

namespace canon::internal {

namespace {

// A segment may start at i when reordering can never move anything across i.
bool IsBoundary(const CharacterDatabase& db, const CodePoint* data, size_t len, size_t i) {
  return i == 0 || i >= len || db.LeadCombiningClass(data[i]) == 0;
}

// Streams the comparison form of data[start..len) one segment at a time.
class SegmentCursor {
 public:
  SegmentCursor(const CharacterDatabase& db,
                const CodePoint* data, size_t len, size_t start,
                CompareOptions options,
                CompareStats* stats)
      : db_(db),
        data_(data),
        len_(len),
        pos_(start),
        input_is_fcd_(options.Has(CompareOption::kInputIsFCD)),
        fold_(options.Has(CompareOption::kIgnoreCase)),
        exclude_special_i_(options.Has(CompareOption::kFoldCaseExcludeSpecialI)),
        stats_(stats) {}

  // Moves to the next non-empty segment; *done is set at end of input.
  rocksdb::Status Next(bool* done) {
    window_ = nullptr;
    window_len_ = 0;
    while (window_len_ == 0) {
      if (pos_ >= len_) {
        *done = true;
        return rocksdb::Status::OK();
      }
      size_t begin = pos_;
      size_t end = begin + 1;
      while (!IsBoundary(db_, data_, len_, end)) ++end;
      pos_ = end;

      rocksdb::Status s = Load(data_ + begin, end - begin);
      if (!s.ok()) return s;
    }
    *done = false;
    return rocksdb::Status::OK();
  }

  const CodePoint* data() const { return window_; }
  size_t size() const { return window_len_; }

 private:
  rocksdb::Status Load(const CodePoint* seg, size_t seg_len) {
    if (!fold_ && QuickCheck(db_, NormalizationMode::kNFD, seg, seg_len) == CheckResult::kYes) {
      window_ = seg;
      window_len_ = seg_len;
      return rocksdb::Status::OK();
    }

    if (stats_) ++stats_->normalized_segments;

    rocksdb::Status s = DecomposeToBuffer(db_, DecompositionKind::kCanonical,
                                          seg, seg_len, seg_len * 2, &decomposed_);
    if (!s.ok()) return s;
    if (!input_is_fcd_ &&
        QuickCheck(db_, NormalizationMode::kFCD, seg, seg_len) != CheckResult::kYes) {
      ReorderCanonical(db_, decomposed_.data(), decomposed_.size());
    }

    if (fold_) {
      folded_.clear();
      Mapping m;
      for (CodePoint c : decomposed_) {
        db_.CaseFold(c, exclude_special_i_, &m);
        folded_.insert(folded_.end(), m.begin(), m.end());
      }
      s = DecomposeToBuffer(db_, DecompositionKind::kCanonical,
                            folded_.data(), folded_.size(), folded_.size(), &decomposed_);
      if (!s.ok()) return s;
      ReorderCanonical(db_, decomposed_.data(), decomposed_.size());
    }

    window_ = decomposed_.data();
    window_len_ = decomposed_.size();
    return rocksdb::Status::OK();
  }

  const CharacterDatabase& db_;
  const CodePoint* data_;
  size_t len_;
  size_t pos_;
  bool input_is_fcd_;
  bool fold_;
  bool exclude_special_i_;
  CompareStats* stats_;

  const CodePoint* window_ = nullptr;
  size_t window_len_ = 0;
  Sequence decomposed_;
  Sequence folded_;
};

}  // namespace

rocksdb::Status CompareEquivalent(const CharacterDatabase& db,
                                  CompareOptions options,
                                  const CodePoint* a, size_t a_len,
                                  const CodePoint* b, size_t b_len,
                                  Ordering* out,
                                  CompareStats* stats) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  // Lockstep over the raw input first.
  const size_t common = std::min(a_len, b_len);
  size_t i = 0;
  while (i < common && a[i] == b[i]) ++i;
  if (i == a_len && i == b_len) {
    if (stats) stats->identical = true;
    *out = Ordering::kEqual;
    return rocksdb::Status::OK();
  }

  // Everything before a boundary shared by both sides normalizes identically.
  // Below i the two inputs agree, so a boundary in one is a boundary in both.
  size_t start = i;
  while (start > 0 && !(IsBoundary(db, a, a_len, start) && IsBoundary(db, b, b_len, start))) {
    --start;
  }

  const bool code_point_order = options.Has(CompareOption::kCodePointOrder);
  SegmentCursor ca(db, a, a_len, start, options, stats);
  SegmentCursor cb(db, b, b_len, start, options, stats);
  size_t ia = 0;
  size_t ib = 0;
  bool a_done = false;
  bool b_done = false;

  for (;;) {
    if (!a_done && ia == ca.size()) {
      rocksdb::Status s = ca.Next(&a_done);
      if (!s.ok()) return s;
      ia = 0;
    }
    if (!b_done && ib == cb.size()) {
      rocksdb::Status s = cb.Next(&b_done);
      if (!s.ok()) return s;
      ib = 0;
    }

    if (a_done || b_done) {
      if (a_done && b_done) {
        *out = Ordering::kEqual;
      } else {
        *out = a_done ? Ordering::kLess : Ordering::kGreater;
      }
      return rocksdb::Status::OK();
    }

    const Ordering o = CompareCodePoints(ca.data()[ia], cb.data()[ib], code_point_order);
    if (o != Ordering::kEqual) {
      *out = o;
      return rocksdb::Status::OK();
    }
    ++ia;
    ++ib;
  }
}

}  // namespace canon::internal
