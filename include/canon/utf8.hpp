#pragma once

#include <string>
#include <string_view>

#include <rocksdb/status.h>

#include <canon/types.hpp>

namespace canon {

/**
 * Decode UTF-8 into code points.
 * @return InvalidArgument on malformed UTF-8 (out is untouched)
 */
rocksdb::Status Utf8ToSequence(std::string_view text, Sequence* out);

/**
 * Encode scalar values as UTF-8.
 * @return InvalidArgument if seq holds a surrogate or a value above U+10FFFF
 *         (out is untouched)
 */
rocksdb::Status SequenceToUtf8(const Sequence& seq, std::string* out);

/** "U+0041 U+0301" */
std::string FormatCodePoints(const Sequence& seq);

/**
 * Parse a whitespace or comma separated list of hex code points, with or
 * without a "U+" / "0x" prefix: "U+0041 301", "0x41,0x301".
 * @return InvalidArgument on a malformed item or a value above U+10FFFF
 */
rocksdb::Status ParseCodePoints(std::string_view text, Sequence* out);

}  // namespace canon
