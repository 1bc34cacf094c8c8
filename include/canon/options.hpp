#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include <rocksdb/status.h>

namespace canon {

class CharacterDatabase;

// Largest accepted Options::min_buffer_capacity, in code points.
constexpr size_t kMaxMinBufferCapacity = size_t{1} << 24;

/** A minimal metrics sink interface (counters + histograms). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, retries, slow paths). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, sizes in code points). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(const rocksdb::Status& status) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

/**
 * Options for canon::Normalizer.
 */
struct Options {
  // Character database. Null selects the ICU-backed database.
  std::shared_ptr<const CharacterDatabase> database;

  // ---------------------------------------------------------------------------
  // Output buffer sizing
  // ---------------------------------------------------------------------------

  // First decomposition attempt reserves input_length * ratio code points
  // (at least min_buffer_capacity). An undershoot costs exactly one retry at
  // the exact size. Must be >= 0.
  double capacity_estimate_ratio = 1.5;
  // At most kMaxMinBufferCapacity.
  size_t min_buffer_capacity = 16;

  // Observability hooks (optional)
  //
  // If set, Normalizer operations emit a small number of counters/histograms
  // and attach attributes/events to spans.
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

}  // namespace canon
