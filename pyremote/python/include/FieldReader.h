// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "pyremote/include/IRemoteReader.h"
#include "pyremote/include/WalkerOptions.h"
#include "pyremote/python/include/LayoutDescriptor.h"
#include "pyremote/python/include/ReadResult.h"

namespace pyremote::python {

// Largest blob readRaw() fetches in one call.
inline constexpr size_t kMaxRawReadSize = 4 * 1024 * 1024;

// Decoded value of a single field. Unsigned, Pointer, BitFlags and InlineData
// produce uint64_t, Signed produces int64_t, CharArray the raw bytes and
// String the UTF-8 text.
using FieldValue =
    std::variant<uint64_t, int64_t, std::vector<uint8_t>, std::string>;

/*
 * Bytes of one structure read from the target in a single call. Fields of
 * that structure are decoded from the copy, so each member observes the same
 * moment of the target's execution.
 */
class StructSnapshot {
 public:
  StructSnapshot(
      const LayoutDescriptor& layout,
      StructKind kind,
      Address address,
      StructSpan span,
      std::vector<uint8_t> bytes);

  Address address() const {
    return address_;
  }

  StructKind kind() const {
    return kind_;
  }

  ReadResult<uint64_t> getUnsigned(Field field) const;
  ReadResult<int64_t> getSigned(Field field) const;

  ReadResult<Address> getPointer(Field field) const {
    return getUnsigned(field);
  }

 private:
  ReadResult<uint64_t> getRaw(Field field) const;

  const LayoutDescriptor* layout_;
  StructKind kind_;
  Address address_;
  StructSpan span_;
  std::vector<uint8_t> bytes_;
};

/*
 * FieldReader interprets the target's memory through the active
 * LayoutDescriptor. It issues exactly one IRemoteReader call per field or
 * structure and never retries: the target keeps running and a second read
 * would observe a different state.
 */
class FieldReader {
 public:
  FieldReader(
      const LayoutDescriptor& layout,
      const IRemoteReader& reader,
      const WalkerOptions& options);

  ReadResult<FieldValue> readField(Address base, Field field) const;

  ReadResult<uint64_t> readUnsigned(Address base, Field field) const;

  ReadResult<int64_t> readSigned(Address base, Field field) const;

  ReadResult<StructSnapshot> readStruct(Address base, StructKind kind) const;

  // Reads `length` bytes verbatim. Lengths above kMaxRawReadSize fail with
  // OutOfRange.
  ReadResult<std::vector<uint8_t>> readRaw(Address address, size_t length)
      const;

  // Address of `field` inside the structure at `base`. Used for inline data.
  ReadResult<Address> fieldAddress(Address base, Field field) const;

  const LayoutDescriptor& layout() const {
    return layout_;
  }

  const WalkerOptions& options() const {
    return options_;
  }

 private:
  const LayoutDescriptor& layout_;
  const IRemoteReader& reader_;
  const WalkerOptions& options_;
};

} // namespace pyremote::python
