#pragma once

#include <canon/character_database.hpp>
#include <canon/options.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace canon::testing {

// =============================================================================
// Table-driven Character Database
// =============================================================================

/**
 * Character database built from explicit tables.
 *
 * Lets tests exercise the engine on data ICU can never produce (cyclic or
 * overlong mappings, oversized expansions) and pin exact property values.
 * Anything not set behaves like an unassigned code point: no mapping,
 * class 0, quick check Yes, folds to itself.
 *
 * Not thread-safe while being populated; read-only use afterwards is.
 */
class TableCharacterDatabase : public CharacterDatabase {
 public:
  // Canonical mappings also apply to compatibility decomposition.
  void SetCanonical(CodePoint c, std::vector<CodePoint> mapping) {
    canonical_[c] = std::move(mapping);
  }

  void SetCompatibility(CodePoint c, std::vector<CodePoint> mapping) {
    compatibility_[c] = std::move(mapping);
  }

  void SetCombiningClass(CodePoint c, uint8_t ccc) { ccc_[c] = ccc; }

  void SetComposite(CodePoint a, CodePoint b, CodePoint composite) {
    composites_[{a, b}] = composite;
  }

  void SetExclusion(CodePoint c) { exclusions_.insert(c); }

  void SetQuickCheck(CodePoint c, NormalizationMode mode, CheckResult result) {
    quick_check_[{c, mode}] = result;
  }

  void SetFold(CodePoint c, std::vector<CodePoint> folded) {
    folds_[c] = std::move(folded);
  }

  void SetVersion(std::string version) { version_ = std::move(version); }

  // Number of Decompose() calls served, for asserting work was skipped.
  uint64_t decompose_calls() const { return decompose_calls_.load(); }

  rocksdb::Status Decompose(CodePoint c,
                            DecompositionKind kind,
                            Mapping* out) const override {
    decompose_calls_.fetch_add(1);
    out->length = 0;

    const std::vector<CodePoint>* mapping = Find(canonical_, c);
    if (!mapping && kind == DecompositionKind::kCompatibility) {
      mapping = Find(compatibility_, c);
    }
    if (!mapping) return rocksdb::Status::OK();
    if (mapping->size() > kMaxMappingLength) {
      return rocksdb::Status::Corruption("mapping too long");
    }
    for (CodePoint part : *mapping) out->code_points[out->length++] = part;
    return rocksdb::Status::OK();
  }

  uint8_t CombiningClass(CodePoint c) const override {
    auto it = ccc_.find(c);
    return it == ccc_.end() ? 0 : it->second;
  }

  bool Compose(CodePoint a, CodePoint b, CodePoint* composite) const override {
    auto it = composites_.find({a, b});
    if (it == composites_.end()) return false;
    *composite = it->second;
    return true;
  }

  bool IsFullCompositionExclusion(CodePoint c) const override {
    return exclusions_.count(c) != 0;
  }

  CheckResult QuickCheckProperty(CodePoint c, NormalizationMode mode) const override {
    auto it = quick_check_.find({c, mode});
    return it == quick_check_.end() ? CheckResult::kYes : it->second;
  }

  void CaseFold(CodePoint c, bool exclude_special_i, Mapping* out) const override {
    (void)exclude_special_i;
    out->length = 0;
    const std::vector<CodePoint>* folded = Find(folds_, c);
    if (!folded) {
      out->code_points[out->length++] = c;
      return;
    }
    for (CodePoint part : *folded) out->code_points[out->length++] = part;
  }

  std::string UnicodeVersion() const override { return version_; }

 private:
  static const std::vector<CodePoint>* Find(
      const std::unordered_map<CodePoint, std::vector<CodePoint>>& table, CodePoint c) {
    auto it = table.find(c);
    return it == table.end() ? nullptr : &it->second;
  }

  std::unordered_map<CodePoint, std::vector<CodePoint>> canonical_;
  std::unordered_map<CodePoint, std::vector<CodePoint>> compatibility_;
  std::unordered_map<CodePoint, std::vector<CodePoint>> folds_;
  std::unordered_map<CodePoint, uint8_t> ccc_;
  std::map<std::pair<CodePoint, CodePoint>, CodePoint> composites_;
  std::map<std::pair<CodePoint, NormalizationMode>, CheckResult> quick_check_;
  std::set<CodePoint> exclusions_;
  std::string version_ = "0.0";
  mutable std::atomic<uint64_t> decompose_calls_{0};
};

// =============================================================================
// Recording Observability Hooks
// =============================================================================

/**
 * Metrics sink that keeps every counter total and histogram sample.
 */
class RecordingMetrics : public MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    histograms_[std::string(name)].push_back(value);
  }

  uint64_t CounterValue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
  }

  std::vector<uint64_t> Samples(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return it == histograms_.end() ? std::vector<uint64_t>{} : it->second;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, std::vector<uint64_t>> histograms_;
};

/** What one finished span recorded. */
struct RecordedSpan {
  std::string name;
  std::map<std::string, std::string> attributes;
  std::vector<std::string> events;
  bool ok = false;
  int end_calls = 0;
};

/**
 * Tracer that records every span it starts, as of when the span ended.
 */
class RecordingTracer : public Tracer {
 public:
  std::unique_ptr<TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<Span>(this, std::string(name));
  }

  std::vector<RecordedSpan> Spans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
  }

 private:
  class Span : public TraceSpan {
   public:
    Span(RecordingTracer* owner, std::string name) : owner_(owner) {
      record_.name = std::move(name);
    }

    void SetAttribute(std::string_view key, uint64_t value) override {
      record_.attributes[std::string(key)] = std::to_string(value);
    }

    void SetAttribute(std::string_view key, std::string_view value) override {
      record_.attributes[std::string(key)] = std::string(value);
    }

    void AddEvent(std::string_view name) override { record_.events.emplace_back(name); }

    void End(const rocksdb::Status& status) override {
      record_.ok = status.ok();
      ++record_.end_calls;
      std::lock_guard<std::mutex> lock(owner_->mutex_);
      owner_->spans_.push_back(record_);
    }

   private:
    RecordingTracer* owner_;
    RecordedSpan record_;
  };

  mutable std::mutex mutex_;
  std::vector<RecordedSpan> spans_;
};

// =============================================================================
// Test Result Aggregation (for thread-safe assertions)
// =============================================================================

/**
 * Thread-safe result collector for concurrent tests.
 * Collects results from multiple threads for assertion on main thread.
 */
class TestResultCollector {
 public:
  void RecordSuccess() { success_count_.fetch_add(1); }

  void RecordFailure(const std::string& message = "") {
    failure_count_.fetch_add(1);
    if (!message.empty()) {
      std::lock_guard<std::mutex> lock(mutex_);
      failure_messages_.push_back(message);
    }
  }

  uint64_t SuccessCount() const { return success_count_.load(); }
  uint64_t FailureCount() const { return failure_count_.load(); }

  bool AllSucceeded() const { return FailureCount() == 0; }

  std::vector<std::string> GetFailureMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_messages_;
  }

 private:
  std::atomic<uint64_t> success_count_{0};
  std::atomic<uint64_t> failure_count_{0};
  mutable std::mutex mutex_;
  std::vector<std::string> failure_messages_;
};

// Check condition and record result
#define CANON_CHECK_AND_RECORD(collector, condition, fail_msg) \
  do { \
    if (condition) { \
      (collector).RecordSuccess(); \
    } else { \
      (collector).RecordFailure(fail_msg); \
    } \
  } while (0)

}  // namespace canon::testing
