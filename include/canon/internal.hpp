#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

#include <canon/types.hpp>

namespace canon::internal {

// Recursion guard for decomposition. Real UCD chains are at most four levels
// deep; anything past this means the database is corrupt or cyclic.
constexpr size_t kMaxDecompositionDepth = 16;

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// "U+0041" style, at least four hex digits.
inline std::string FormatCodePoint(CodePoint c) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(c));
  return buf;
}

// Sort key reproducing UTF-16 code unit order for scalar values:
// U+0000..U+D7FF < supplementary (lead surrogates D800..DBFF) < U+E000..U+FFFF.
inline uint32_t CodeUnitOrderKey(CodePoint c) {
  if (c < 0xD800) return c;
  if (c >= 0x10000) return c - 0x10000 + 0xD800;
  if (c >= 0xE000) return c + 0x100000;
  return c;
}

inline Ordering CompareCodePoints(CodePoint a, CodePoint b, bool code_point_order) {
  if (a == b) return Ordering::kEqual;
  if (!code_point_order) {
    a = CodeUnitOrderKey(a);
    b = CodeUnitOrderKey(b);
  }
  return a < b ? Ordering::kLess : Ordering::kGreater;
}

// Index of the first code point that is not a scalar value, or len.
inline size_t FindInvalidScalar(const CodePoint* data, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    if (!IsScalarValue(data[i])) return i;
  }
  return len;
}

}  // namespace canon::internal
