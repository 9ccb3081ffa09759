// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pyremote/python/include/FieldReader.h"

namespace pyremote::python {

// Appends the UTF-8 encoding of `codePoint`. Surrogates and values above
// U+10FFFF are replaced with U+FFFD.
void appendUtf8(std::string& out, uint32_t codePoint);

/*
 * Decodes the target interpreter's str and bytes objects.
 *
 * A str is read as its PyASCIIObject header first. Compact ASCII strings keep
 * their data right after that header, other compact strings after the
 * PyCompactUnicodeObject header, and legacy strings behind a data pointer.
 * The kind (1, 2 or 4 bytes per code point) decides how the data is widened
 * before it is re-encoded as UTF-8.
 */
class StringDecoder {
 public:
  explicit StringDecoder(const FieldReader& reader) : reader_(reader) {}

  // UTF-8 text of the str object at `address`, truncated to
  // WalkerOptions::maxStringLength code points.
  ReadResult<std::string> decode(Address address) const;

  // Contents of the bytes object at `address`. Objects larger than `maxSize`
  // fail with OutOfRange without reading their data.
  ReadResult<std::vector<uint8_t>> decodeBytes(
      Address address,
      size_t maxSize = kMaxRawReadSize) const;

 private:
  ReadResult<std::string>
  decodeUnits(Address data, size_t count, uint64_t kind) const;

  ReadResult<std::string> decodeNotReady(
      const StructSnapshot& header,
      size_t count) const;

  ReadResult<std::string> decodeCachedUtf8(Address utf8, int64_t length) const;

  const FieldReader& reader_;
};

} // namespace pyremote::python
