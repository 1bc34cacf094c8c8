#include <canon/normalize.hpp>

#include <algorithm>
#include <cmath>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

#include <canon/canonical_order.hpp>
#include <canon/composer.hpp>
#include <canon/decomposer.hpp>
#include <canon/equivalence.hpp>
#include <canon/internal.hpp>
#include <canon/quick_check.hpp>
#include <canon/utf8.hpp>

namespace canon {

namespace {

// --------------------------
// Observability helpers
// --------------------------
inline void EmitCounter(const canon::Options& opt,
                        std::string_view name,
                        uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const canon::Options& opt,
                          std::string_view name,
                          uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

// Map statuses to low-cardinality strings for tracing.
// (Avoid putting status.ToString() into attributes; it's high-cardinality.)
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsMemoryLimit()) return "memory_limit";
  if (s.IsAborted()) return "aborted";
  if (s.IsCorruption()) return "corruption";
  if (s.IsIncomplete()) return "incomplete";
  return "other";
}

inline void SpanAttr(canon::TraceSpan* span,
                     std::string_view key,
                     uint64_t value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanAttr(canon::TraceSpan* span,
                     std::string_view key,
                     std::string_view value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanEvent(canon::TraceSpan* span, std::string_view name) {
  if (span) span->AddEvent(name);
}

rocksdb::Status ValidateScalars(const Sequence& text, const char* name) {
  const size_t bad = internal::FindInvalidScalar(text.data(), text.size());
  if (bad == text.size()) return rocksdb::Status::OK();
  return rocksdb::Status::InvalidArgument(
      std::string(name) + " holds " + internal::FormatCodePoint(text[bad]) +
      " at index " + std::to_string(bad) + ", which is not a Unicode scalar value");
}

}  // namespace

Normalizer::Normalizer(const Options& opt) : opt_(opt), db_(opt.database) {}

Normalizer::~Normalizer() = default;

rocksdb::Status Normalizer::Create(std::unique_ptr<Normalizer>* out, const Options& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (!std::isfinite(opt.capacity_estimate_ratio) || opt.capacity_estimate_ratio < 0.0) {
    return rocksdb::Status::InvalidArgument("capacity_estimate_ratio must be a finite value >= 0");
  }
  if (opt.min_buffer_capacity > kMaxMinBufferCapacity) {
    return rocksdb::Status::InvalidArgument("min_buffer_capacity exceeds " +
                                            std::to_string(kMaxMinBufferCapacity));
  }

  auto normalizer = std::unique_ptr<Normalizer>(new Normalizer(opt));
  if (!normalizer->db_) {
    std::unique_ptr<CharacterDatabase> icu;
    rocksdb::Status s = CharacterDatabase::OpenIcu(&icu);
    if (!s.ok()) return s;
    normalizer->db_ = std::move(icu);
  }

  *out = std::move(normalizer);
  return rocksdb::Status::OK();
}

rocksdb::Status Normalizer::Normalize(NormalizationMode mode,
                                      const Sequence& text,
                                      Sequence* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  EmitCounter(opt_, "canon.normalize.calls", 1);
  EmitHistogram(opt_, "canon.normalize.input_codepoints", static_cast<uint64_t>(text.size()));

  const uint64_t op_start_us = internal::NowMicros();
  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("canon.Normalize");
  SpanAttr(span.get(), "mode", ToString(mode));
  SpanAttr(span.get(), "input_codepoints", static_cast<uint64_t>(text.size()));

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    const uint64_t dur_us = internal::NowMicros() - op_start_us;
    EmitHistogram(opt_, "canon.normalize.latency_us", dur_us);
    EmitCounter(opt_, st.ok() ? "canon.normalize.ok_total" : "canon.normalize.error_total", 1);

    if (span) {
      SpanAttr(span.get(), "latency_us", dur_us);
      SpanAttr(span.get(), "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  Sequence result;
  rocksdb::Status s;
  try {
    s = NormalizeImpl(mode, text, &result);
  } catch (const std::bad_alloc&) {
    s = rocksdb::Status::MemoryLimit("out of memory while normalizing");
  } catch (const std::length_error&) {
    s = rocksdb::Status::MemoryLimit("normalization buffer exceeds the maximum size");
  }
  if (!s.ok()) return finish(s);

  EmitHistogram(opt_, "canon.normalize.output_codepoints", static_cast<uint64_t>(result.size()));
  SpanAttr(span.get(), "output_codepoints", static_cast<uint64_t>(result.size()));
  *out = std::move(result);
  return finish(s);
}

rocksdb::Status Normalizer::NormalizeImpl(NormalizationMode mode,
                                          const Sequence& text,
                                          Sequence* out) const {
  rocksdb::Status s = ValidateScalars(text, "text");
  if (!s.ok()) return s;

  DecompositionKind kind = DecompositionKind::kCanonical;
  bool compose = false;
  switch (mode) {
    case NormalizationMode::kNone:
      *out = text;
      return rocksdb::Status::OK();
    case NormalizationMode::kFCD:
      if (internal::QuickCheck(*db_, mode, text.data(), text.size()) == CheckResult::kYes) {
        *out = text;
        return rocksdb::Status::OK();
      }
      break;
    case NormalizationMode::kNFD:
      break;
    case NormalizationMode::kNFKD:
      kind = DecompositionKind::kCompatibility;
      break;
    case NormalizationMode::kNFC:
      compose = true;
      break;
    case NormalizationMode::kNFKC:
      kind = DecompositionKind::kCompatibility;
      compose = true;
      break;
  }

  // First guess at the decomposed length, bounded by the largest possible
  // expansion so an absurd ratio cannot request an absurd buffer.
  const double estimate = std::ceil(static_cast<double>(text.size()) * opt_.capacity_estimate_ratio);
  const double ceiling = static_cast<double>(text.size()) * static_cast<double>(kMaxMappingLength) *
                         static_cast<double>(internal::kMaxDecompositionDepth);
  const size_t capacity = std::max(opt_.min_buffer_capacity,
                                   static_cast<size_t>(std::min(estimate, ceiling)));

  bool retried = false;
  s = internal::DecomposeToBuffer(*db_, kind, text.data(), text.size(), capacity, out, &retried);
  if (retried) EmitCounter(opt_, "canon.normalize.buffer_retry_total", 1);
  if (!s.ok()) return s;

  internal::ReorderCanonical(*db_, out->data(), out->size());

  if (compose) {
    out->resize(internal::ComposeCanonical(*db_, out->data(), out->size()));
  }
  return rocksdb::Status::OK();
}

CheckResult Normalizer::QuickCheck(NormalizationMode mode, const Sequence& text) const {
  return internal::QuickCheck(*db_, mode, text.data(), text.size());
}

rocksdb::Status Normalizer::IsNormalized(NormalizationMode mode,
                                         const Sequence& text,
                                         bool* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  EmitCounter(opt_, "canon.is_normalized.calls", 1);

  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("canon.IsNormalized");
  SpanAttr(span.get(), "mode", ToString(mode));

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    if (span) {
      SpanAttr(span.get(), "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  rocksdb::Status s = ValidateScalars(text, "text");
  if (!s.ok()) return finish(s);

  const CheckResult quick = QuickCheck(mode, text);
  SpanAttr(span.get(), "quick_check", ToString(quick));
  if (quick != CheckResult::kPerhaps) {
    *out = (quick == CheckResult::kYes);
    return finish(s);
  }

  EmitCounter(opt_, "canon.is_normalized.slow_path_total", 1);
  SpanEvent(span.get(), "normalize_and_compare");

  Sequence normalized;
  try {
    s = NormalizeImpl(mode, text, &normalized);
  } catch (const std::bad_alloc&) {
    s = rocksdb::Status::MemoryLimit("out of memory while normalizing");
  }
  if (!s.ok()) return finish(s);

  *out = (normalized == text);
  return finish(s);
}

rocksdb::Status Normalizer::Compare(CompareOptions options,
                                    const Sequence& a,
                                    const Sequence& b,
                                    Ordering* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  EmitCounter(opt_, "canon.compare.calls", 1);

  const uint64_t op_start_us = internal::NowMicros();
  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("canon.Compare");
  SpanAttr(span.get(), "a_codepoints", static_cast<uint64_t>(a.size()));
  SpanAttr(span.get(), "b_codepoints", static_cast<uint64_t>(b.size()));

  internal::CompareStats stats;
  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    const uint64_t dur_us = internal::NowMicros() - op_start_us;
    EmitHistogram(opt_, "canon.compare.latency_us", dur_us);
    if (stats.identical) EmitCounter(opt_, "canon.compare.fast_path_total", 1);
    if (stats.normalized_segments > 0) {
      EmitCounter(opt_, "canon.compare.normalized_segments", stats.normalized_segments);
    }

    if (span) {
      SpanAttr(span.get(), "latency_us", dur_us);
      SpanAttr(span.get(), "normalized_segments", stats.normalized_segments);
      SpanAttr(span.get(), "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  rocksdb::Status s = ValidateScalars(a, "a");
  if (s.ok()) s = ValidateScalars(b, "b");
  if (!s.ok()) return finish(s);

  Ordering result = Ordering::kEqual;
  try {
    s = internal::CompareEquivalent(*db_, options, a.data(), a.size(), b.data(), b.size(),
                                    &result, &stats);
  } catch (const std::bad_alloc&) {
    s = rocksdb::Status::MemoryLimit("out of memory while comparing");
  }
  if (s.ok()) *out = result;
  return finish(s);
}

rocksdb::Status Normalizer::NormalizeUtf8(NormalizationMode mode,
                                          std::string_view text,
                                          std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  Sequence seq;
  rocksdb::Status s = Utf8ToSequence(text, &seq);
  if (!s.ok()) return s;

  Sequence normalized;
  s = Normalize(mode, seq, &normalized);
  if (!s.ok()) return s;

  return SequenceToUtf8(normalized, out);
}

rocksdb::Status Normalizer::IsNormalizedUtf8(NormalizationMode mode,
                                             std::string_view text,
                                             bool* out) const {
  Sequence seq;
  rocksdb::Status s = Utf8ToSequence(text, &seq);
  if (!s.ok()) return s;
  return IsNormalized(mode, seq, out);
}

rocksdb::Status Normalizer::CompareUtf8(CompareOptions options,
                                        std::string_view a,
                                        std::string_view b,
                                        Ordering* out) const {
  Sequence sa;
  Sequence sb;
  rocksdb::Status s = Utf8ToSequence(a, &sa);
  if (s.ok()) s = Utf8ToSequence(b, &sb);
  if (!s.ok()) return s;
  return Compare(options, sa, sb, out);
}

}  // namespace canon
