#include <canon/utf8.hpp>

#include <unicode/utf8.h>

#include <climits>
#include <cstdint>
#include <string>
#include <utility>

#include <canon/internal.hpp>

namespace canon {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool IsSeparator(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',';
}

}  // namespace

rocksdb::Status Utf8ToSequence(std::string_view text, Sequence* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (text.size() > static_cast<size_t>(INT32_MAX)) {
    return rocksdb::Status::InvalidArgument("text too long");
  }

  const auto* s = reinterpret_cast<const uint8_t*>(text.data());
  const int32_t length = static_cast<int32_t>(text.size());

  Sequence result;
  result.reserve(text.size());
  int32_t i = 0;
  while (i < length) {
    const int32_t at = i;
    UChar32 c;
    U8_NEXT(s, i, length, c);
    if (c < 0) {
      return rocksdb::Status::InvalidArgument("malformed UTF-8 at byte " + std::to_string(at));
    }
    result.push_back(static_cast<CodePoint>(c));
  }

  *out = std::move(result);
  return rocksdb::Status::OK();
}

rocksdb::Status SequenceToUtf8(const Sequence& seq, std::string* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::string result;
  result.reserve(seq.size());
  for (size_t i = 0; i < seq.size(); ++i) {
    const CodePoint c = seq[i];
    if (!IsScalarValue(c)) {
      return rocksdb::Status::InvalidArgument("cannot encode " + internal::FormatCodePoint(c) +
                                              " at index " + std::to_string(i) + " as UTF-8");
    }
    uint8_t buf[U8_MAX_LENGTH];
    int32_t offset = 0;
    U8_APPEND_UNSAFE(buf, offset, static_cast<UChar32>(c));
    result.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(offset));
  }
  *out = std::move(result);
  return rocksdb::Status::OK();
}

std::string FormatCodePoints(const Sequence& seq) {
  std::string result;
  for (size_t i = 0; i < seq.size(); ++i) {
    if (i > 0) result += ' ';
    result += internal::FormatCodePoint(seq[i]);
  }
  return result;
}

rocksdb::Status ParseCodePoints(std::string_view text, Sequence* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  Sequence result;
  size_t i = 0;
  while (i < text.size()) {
    if (IsSeparator(text[i])) {
      ++i;
      continue;
    }

    size_t start = i;
    while (i < text.size() && !IsSeparator(text[i])) ++i;
    std::string_view item = text.substr(start, i - start);

    if (item.size() > 2 && (item[0] == 'U' || item[0] == 'u') && item[1] == '+') {
      item.remove_prefix(2);
    } else if (item.size() > 2 && item[0] == '0' && (item[1] == 'x' || item[1] == 'X')) {
      item.remove_prefix(2);
    }

    if (item.empty() || item.size() > 8) {
      return rocksdb::Status::InvalidArgument("bad code point: " + std::string(text.substr(start, i - start)));
    }
    uint32_t value = 0;
    for (char c : item) {
      int v = HexValue(c);
      if (v < 0) {
        return rocksdb::Status::InvalidArgument("bad code point: " + std::string(text.substr(start, i - start)));
      }
      value = (value << 4) | static_cast<uint32_t>(v);
    }
    if (value > kMaxCodePoint) {
      return rocksdb::Status::InvalidArgument("code point out of range: " + std::string(item));
    }
    result.push_back(value);
  }

  *out = std::move(result);
  return rocksdb::Status::OK();
}

}  // namespace canon
