// Performance benchmarks for canon
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: single engine stages (decompose, reorder, compose, quick check)
// 2. MACROBENCHMARKS: Normalizer operations (Normalize, IsNormalized, Compare)
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed seeds and dataset sizes for reproducible results

#include <benchmark/benchmark.h>

#include <canon/canonical_order.hpp>
#include <canon/composer.hpp>
#include <canon/decomposer.hpp>
#include <canon/normalize.hpp>
#include <canon/quick_check.hpp>

#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

namespace {

// =============================================================================
// Benchmark Fixtures and Helpers
// =============================================================================

const canon::Normalizer& SharedNormalizer() {
  static std::unique_ptr<canon::Normalizer> normalizer = [] {
    std::unique_ptr<canon::Normalizer> n;
    auto s = canon::Normalizer::Create(&n);
    if (!s.ok()) throw std::runtime_error("Normalizer::Create failed: " + s.ToString());
    return n;
  }();
  return *normalizer;
}

// Pure ASCII: the common case every stage should pass through quickly.
canon::Sequence AsciiText(size_t n) {
  canon::Sequence text;
  text.reserve(n);
  for (size_t i = 0; i < n; ++i) text.push_back('a' + static_cast<canon::CodePoint>(i % 26));
  return text;
}

// Latin letters with precomposed forms, combining marks, Hangul and
// compatibility characters, drawn with a fixed seed.
canon::Sequence MixedText(size_t n) {
  static const canon::CodePoint kPool[] = {
      0x0041, 0x0065, 0x006F, 0x00C1, 0x00E9, 0x1E69, 0x0301, 0x0323, 0x0316,
      0x0308, 0xAC00, 0xAC01, 0x1100, 0x1161, 0x11A8, 0xFB03, 0x212B, 0x0020};
  std::mt19937 gen(42);
  std::uniform_int_distribution<size_t> dis(0, sizeof(kPool) / sizeof(kPool[0]) - 1);
  canon::Sequence text;
  text.reserve(n);
  for (size_t i = 0; i < n; ++i) text.push_back(kPool[dis(gen)]);
  return text;
}

// =============================================================================
// PART 1: MICROBENCHMARKS - single stages
// =============================================================================

static void BM_Decompose_Mixed(benchmark::State& state) {
  const auto& db = SharedNormalizer().database();
  canon::Sequence input = MixedText(static_cast<size_t>(state.range(0)));
  canon::Sequence buf;
  for (auto _ : state) {
    auto s = canon::internal::DecomposeToBuffer(db, canon::DecompositionKind::kCompatibility,
                                                input.data(), input.size(),
                                                input.size() * 2, &buf);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(buf.data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Decompose_Mixed)->Range(64, 1 << 16);

static void BM_ReorderCanonical(benchmark::State& state) {
  const auto& db = SharedNormalizer().database();
  canon::Sequence input;
  for (int i = 0; i < state.range(0) / 4; ++i) {
    input.insert(input.end(), {0x61, 0x0301, 0x0316, 0x0323});  // Out of order marks
  }
  canon::Sequence work;
  for (auto _ : state) {
    work = input;
    canon::internal::ReorderCanonical(db, work.data(), work.size());
    benchmark::DoNotOptimize(work.data());
  }
  state.SetItemsProcessed(state.iterations() * input.size());
}
BENCHMARK(BM_ReorderCanonical)->Range(64, 1 << 16);

static void BM_ComposeCanonical(benchmark::State& state) {
  const auto& db = SharedNormalizer().database();
  canon::Sequence input;
  for (int i = 0; i < state.range(0) / 2; ++i) {
    input.insert(input.end(), {0x41, 0x0301});
  }
  canon::Sequence work;
  for (auto _ : state) {
    work = input;
    size_t n = canon::internal::ComposeCanonical(db, work.data(), work.size());
    benchmark::DoNotOptimize(n);
  }
  state.SetItemsProcessed(state.iterations() * input.size());
}
BENCHMARK(BM_ComposeCanonical)->Range(64, 1 << 16);

static void BM_QuickCheck_NFC_Ascii(benchmark::State& state) {
  const auto& db = SharedNormalizer().database();
  canon::Sequence input = AsciiText(static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto r = canon::internal::QuickCheck(db, canon::NormalizationMode::kNFC,
                                         input.data(), input.size());
    benchmark::DoNotOptimize(r);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_QuickCheck_NFC_Ascii)->Range(64, 1 << 16);

// =============================================================================
// PART 2: MACROBENCHMARKS - Normalizer operations
// =============================================================================

static void BM_Normalize(benchmark::State& state, canon::NormalizationMode mode) {
  const auto& normalizer = SharedNormalizer();
  canon::Sequence input = MixedText(static_cast<size_t>(state.range(0)));
  canon::Sequence out;
  for (auto _ : state) {
    auto s = normalizer.Normalize(mode, input, &out);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(out.data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_CAPTURE(BM_Normalize, NFD, canon::NormalizationMode::kNFD)->Range(64, 1 << 16);
BENCHMARK_CAPTURE(BM_Normalize, NFC, canon::NormalizationMode::kNFC)->Range(64, 1 << 16);
BENCHMARK_CAPTURE(BM_Normalize, NFKC, canon::NormalizationMode::kNFKC)->Range(64, 1 << 16);
BENCHMARK_CAPTURE(BM_Normalize, FCD, canon::NormalizationMode::kFCD)->Range(64, 1 << 16);

static void BM_IsNormalized_NFC_Ascii(benchmark::State& state) {
  const auto& normalizer = SharedNormalizer();
  canon::Sequence input = AsciiText(static_cast<size_t>(state.range(0)));
  bool normalized = false;
  for (auto _ : state) {
    auto s = normalizer.IsNormalized(canon::NormalizationMode::kNFC, input, &normalized);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(normalized);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_IsNormalized_NFC_Ascii)->Range(64, 1 << 16);

// Long shared prefix, difference at the very end: exercises prefix skipping.
static void BM_Compare_SharedPrefix(benchmark::State& state) {
  const auto& normalizer = SharedNormalizer();
  canon::Sequence a = MixedText(static_cast<size_t>(state.range(0)));
  canon::Sequence b = a;
  a.push_back(0x61);
  b.push_back(0x62);
  canon::Ordering order = canon::Ordering::kEqual;
  for (auto _ : state) {
    auto s = normalizer.Compare(canon::CompareOptions{}, a, b, &order);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(order);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Compare_SharedPrefix)->Range(64, 1 << 16);

// Equivalent but spelled differently from the first code point on.
static void BM_Compare_Equivalent(benchmark::State& state) {
  const auto& normalizer = SharedNormalizer();
  canon::Sequence a = MixedText(static_cast<size_t>(state.range(0)));
  canon::Sequence b;
  auto s = normalizer.Normalize(canon::NormalizationMode::kNFD, a, &b);
  if (!s.ok()) {
    state.SkipWithError(s.ToString().c_str());
    return;
  }
  canon::Ordering order = canon::Ordering::kEqual;
  for (auto _ : state) {
    s = normalizer.Compare(canon::CompareOptions{}, a, b, &order);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(order);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Compare_Equivalent)->Range(64, 1 << 16);

static void BM_Compare_IgnoreCase(benchmark::State& state) {
  const auto& normalizer = SharedNormalizer();
  canon::Sequence a;
  canon::Sequence b;
  for (int i = 0; i < state.range(0); ++i) {
    a.push_back('A' + static_cast<canon::CodePoint>(i % 26));
    b.push_back('a' + static_cast<canon::CodePoint>(i % 26));
  }
  canon::Ordering order = canon::Ordering::kEqual;
  const canon::CompareOptions opts{canon::CompareOption::kIgnoreCase};
  for (auto _ : state) {
    auto s = normalizer.Compare(opts, a, b, &order);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(order);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Compare_IgnoreCase)->Range(64, 1 << 16);

}  // namespace

BENCHMARK_MAIN();
