// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/FieldReader.h"

#include <cerrno>
#include <cstring>
#include <limits>
#include <utility>

#include <fmt/format.h>
#include "pyremote/python/include/StringDecoder.h"
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::python {

namespace {

bool isIntegerRule(DecodeRule rule) {
  switch (rule) {
    case DecodeRule::Unsigned:
    case DecodeRule::Signed:
    case DecodeRule::Pointer:
    case DecodeRule::BitFlags:
    case DecodeRule::String:
      return true;
    case DecodeRule::CharArray:
    case DecodeRule::InlineData:
      return false;
  }
  return false;
}

// Little-endian integer of spec.width bytes at `data`, with bit-packed flags
// extracted.
ReadResult<uint64_t> decodeInteger(const FieldSpec& spec, const uint8_t* data) {
  if (spec.width == 0 || spec.width > sizeof(uint64_t)) {
    return ReadError::OutOfRange;
  }
  uint64_t value = 0;
  std::memcpy(&value, data, spec.width);
  if (spec.rule == DecodeRule::BitFlags) {
    if (spec.bitWidth == 0 || spec.bitOffset + spec.bitWidth > 64) {
      return ReadError::OutOfRange;
    }
    value >>= spec.bitOffset;
    if (spec.bitWidth < 64) {
      value &= (uint64_t{1} << spec.bitWidth) - 1;
    }
  }
  return value;
}

int64_t signExtend(uint64_t value, uint32_t width) {
  if (width >= sizeof(uint64_t)) {
    return static_cast<int64_t>(value);
  }
  const unsigned shift = 64 - width * 8;
  return static_cast<int64_t>(value << shift) >> shift;
}

ReadResult<uint64_t> toUnsigned(const FieldSpec& spec, uint64_t raw) {
  if (spec.rule == DecodeRule::Signed && signExtend(raw, spec.width) < 0) {
    return ReadError::OutOfRange;
  }
  return raw;
}

ReadResult<int64_t> toSigned(const FieldSpec& spec, uint64_t raw) {
  if (spec.rule == DecodeRule::Signed) {
    return signExtend(raw, spec.width);
  }
  if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return ReadError::OutOfRange;
  }
  return static_cast<int64_t>(raw);
}

ReadResult<Address> offsetAddress(Address base, uintptr_t offset) {
  if (base == 0) {
    return ReadError::Unmapped;
  }
  if (base > std::numeric_limits<Address>::max() - offset) {
    return ReadError::OutOfRange;
  }
  return base + offset;
}

} // namespace

StructSnapshot::StructSnapshot(
    const LayoutDescriptor& layout,
    StructKind kind,
    Address address,
    StructSpan span,
    std::vector<uint8_t> bytes)
    : layout_(&layout),
      kind_(kind),
      address_(address),
      span_(span),
      bytes_(std::move(bytes)) {}

ReadResult<uint64_t> StructSnapshot::getRaw(Field field) const {
  const auto& spec = layout_->field(field);
  if (!spec.supported()) {
    return ReadError::UnsupportedField;
  }
  if (structKindOf(field) != kind_) {
    return ReadError::OutOfRange;
  }
  if (spec.rule == DecodeRule::InlineData) {
    return offsetAddress(address_, spec.offset);
  }
  if (!isIntegerRule(spec.rule) || spec.offset < span_.begin ||
      spec.offset - span_.begin + spec.width > bytes_.size()) {
    return ReadError::OutOfRange;
  }
  return decodeInteger(spec, bytes_.data() + (spec.offset - span_.begin));
}

ReadResult<uint64_t> StructSnapshot::getUnsigned(Field field) const {
  auto raw = getRaw(field);
  if (!raw) {
    return raw;
  }
  return toUnsigned(layout_->field(field), *raw);
}

ReadResult<int64_t> StructSnapshot::getSigned(Field field) const {
  auto raw = getRaw(field);
  if (!raw) {
    return raw.error();
  }
  return toSigned(layout_->field(field), *raw);
}

FieldReader::FieldReader(
    const LayoutDescriptor& layout,
    const IRemoteReader& reader,
    const WalkerOptions& options)
    : layout_(layout), reader_(reader), options_(options) {}

ReadResult<std::vector<uint8_t>> FieldReader::readRaw(
    Address address,
    size_t length) const {
  if (length > kMaxRawReadSize) {
    pyremote_lib_print(
        PYREMOTE_LIB_DEBUG,
        fmt::format(
            "Refusing to read {} bytes at {:#x}, limit is {}",
            length,
            address,
            kMaxRawReadSize)
            .c_str());
    return ReadError::OutOfRange;
  }
  if (address == 0) {
    return ReadError::Unmapped;
  }
  std::vector<uint8_t> buf(length);
  if (length == 0) {
    return buf;
  }
  ssize_t ret = reader_.read(address, buf.data(), length);
  if (ret < 0) {
    if (ret != -EFAULT) {
      pyremote_lib_print(
          PYREMOTE_LIB_DEBUG,
          fmt::format(
              "Failed to read {} bytes at {:#x}: {}",
              length,
              address,
              std::strerror(static_cast<int>(-ret)))
              .c_str());
    }
    return ReadError::Unmapped;
  }
  if (static_cast<size_t>(ret) < length) {
    return ReadError::OutOfRange;
  }
  return buf;
}

ReadResult<Address> FieldReader::fieldAddress(Address base, Field field)
    const {
  const auto& spec = layout_.field(field);
  if (!spec.supported()) {
    return ReadError::UnsupportedField;
  }
  return offsetAddress(base, spec.offset);
}

ReadResult<FieldValue> FieldReader::readField(Address base, Field field)
    const {
  const auto& spec = layout_.field(field);
  auto address = fieldAddress(base, field);
  if (!address) {
    return address.error();
  }
  if (spec.rule == DecodeRule::InlineData) {
    return FieldValue(static_cast<uint64_t>(*address));
  }

  auto bytes = readRaw(*address, spec.width);
  if (!bytes) {
    return bytes.error();
  }
  if (spec.rule == DecodeRule::CharArray) {
    return FieldValue(std::move(bytes).value());
  }

  auto raw = decodeInteger(spec, bytes->data());
  if (!raw) {
    return raw.error();
  }
  switch (spec.rule) {
    case DecodeRule::Signed:
      return FieldValue(signExtend(*raw, spec.width));
    case DecodeRule::String: {
      auto text = StringDecoder(*this).decode(*raw);
      if (!text) {
        return text.error();
      }
      return FieldValue(std::move(text).value());
    }
    default:
      return FieldValue(*raw);
  }
}

ReadResult<uint64_t> FieldReader::readUnsigned(Address base, Field field)
    const {
  auto value = readField(base, field);
  if (!value) {
    return value.error();
  }
  if (const auto* u = std::get_if<uint64_t>(&*value)) {
    return *u;
  }
  if (const auto* s = std::get_if<int64_t>(&*value)) {
    if (*s < 0) {
      return ReadError::OutOfRange;
    }
    return static_cast<uint64_t>(*s);
  }
  return ReadError::OutOfRange;
}

ReadResult<int64_t> FieldReader::readSigned(Address base, Field field) const {
  auto value = readField(base, field);
  if (!value) {
    return value.error();
  }
  if (const auto* s = std::get_if<int64_t>(&*value)) {
    return *s;
  }
  if (const auto* u = std::get_if<uint64_t>(&*value)) {
    if (*u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return ReadError::OutOfRange;
    }
    return static_cast<int64_t>(*u);
  }
  return ReadError::OutOfRange;
}

ReadResult<StructSnapshot> FieldReader::readStruct(
    Address base,
    StructKind kind) const {
  auto span = layout_.span(kind);
  if (span.size() == 0) {
    return ReadError::UnsupportedField;
  }
  auto address = offsetAddress(base, span.begin);
  if (!address) {
    return address.error();
  }
  auto bytes = readRaw(*address, span.size());
  if (!bytes) {
    return bytes.error();
  }
  return StructSnapshot(layout_, kind, base, span, std::move(bytes).value());
}

} // namespace pyremote::python
