// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/StringDecoder.h"

#include <algorithm>
#include <cstring>

#include <fmt/format.h>
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::python {

static constexpr uint32_t kReplacementCharacter = 0xFFFD;
static constexpr size_t kMaxUtf8BytesPerCodePoint = 4;

void appendUtf8(std::string& out, uint32_t codePoint) {
  if (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
    codePoint = kReplacementCharacter;
  }
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
}

ReadResult<std::string> StringDecoder::decode(Address address) const {
  if (address == 0) {
    return ReadError::Unmapped;
  }
  auto header = reader_.readStruct(address, StructKind::String);
  if (!header) {
    return header.error();
  }

  auto length = header->getSigned(Field::String_length);
  auto kind = header->getUnsigned(Field::String_state_kind);
  auto compact = header->getUnsigned(Field::String_state_compact);
  auto ascii = header->getUnsigned(Field::String_state_ascii);
  auto ready = header->getUnsigned(Field::String_state_ready);
  for (const auto* flag : {&kind, &compact, &ascii, &ready}) {
    if (!*flag) {
      return flag->error();
    }
  }
  if (!length) {
    return length.error();
  }
  if (*length < 0) {
    return ReadError::OutOfRange;
  }

  size_t count = static_cast<size_t>(*length);
  const size_t maxLength = reader_.options().maxStringLength;
  if (count > maxLength) {
    pyremote_lib_print(
        PYREMOTE_LIB_DEBUG,
        fmt::format(
            "Truncating {} character string at {:#x} to {}",
            count,
            address,
            maxLength)
            .c_str());
    count = maxLength;
  }

  if (*ready == 0) {
    return decodeNotReady(*header, count);
  }

  if (*compact != 0 && *ascii != 0) {
    auto data = reader_.fieldAddress(address, Field::String_ascii_data);
    if (!data) {
      return data.error();
    }
    return decodeUnits(*data, count, 1);
  }

  if (*compact != 0) {
    auto data = reader_.fieldAddress(address, Field::String_compact_data);
    if (!data) {
      return data.error();
    }
    return decodeUnits(*data, count, *kind);
  }

  auto extra = reader_.readStruct(address, StructKind::CompactString);
  if (!extra) {
    return extra.error();
  }
  auto data = extra->getPointer(Field::String_data);
  if (!data) {
    return data.error();
  }
  if (*data == 0) {
    auto utf8 = extra->getPointer(Field::String_utf8);
    auto utf8Length = extra->getSigned(Field::String_utf8_length);
    if (utf8 && *utf8 != 0 && utf8Length) {
      return decodeCachedUtf8(*utf8, *utf8Length);
    }
    return ReadError::Unmapped;
  }
  return decodeUnits(*data, count, *kind);
}

ReadResult<std::string> StringDecoder::decodeNotReady(
    const StructSnapshot& header,
    size_t count) const {
  auto extra = reader_.readStruct(header.address(), StructKind::CompactString);
  if (!extra) {
    return extra.error();
  }

  auto utf8 = extra->getPointer(Field::String_utf8);
  auto utf8Length = extra->getSigned(Field::String_utf8_length);
  if (utf8 && *utf8 != 0 && utf8Length) {
    return decodeCachedUtf8(*utf8, *utf8Length);
  }

  auto wstr = header.getPointer(Field::String_wstr);
  if (wstr && *wstr != 0) {
    auto wstrLength = extra->getSigned(Field::String_wstr_length);
    size_t units = count;
    if (wstrLength && *wstrLength >= 0) {
      units = std::min(
          static_cast<size_t>(*wstrLength), reader_.options().maxStringLength);
    }
    // wchar_t is 4 bytes on Linux.
    return decodeUnits(*wstr, units, 4);
  }

  auto data = reader_.fieldAddress(header.address(), Field::String_ascii_data);
  if (!data) {
    return data.error();
  }
  return decodeUnits(*data, count, 1);
}

ReadResult<std::string>
StringDecoder::decodeUnits(Address data, size_t count, uint64_t kind) const {
  if (kind != 1 && kind != 2 && kind != 4) {
    return ReadError::OutOfRange;
  }
  auto bytes = reader_.readRaw(data, count * kind);
  if (!bytes) {
    return bytes.error();
  }

  std::string out;
  out.reserve(count);
  const uint8_t* p = bytes->data();
  for (size_t ii = 0; ii < count; ++ii, p += kind) {
    uint32_t codePoint = 0;
    if (kind == 1) {
      codePoint = *p;
    } else if (kind == 2) {
      uint16_t unit;
      std::memcpy(&unit, p, sizeof(unit));
      codePoint = unit;
    } else {
      std::memcpy(&codePoint, p, sizeof(codePoint));
    }
    appendUtf8(out, codePoint);
  }
  return out;
}

ReadResult<std::string> StringDecoder::decodeCachedUtf8(
    Address utf8,
    int64_t length) const {
  if (length < 0) {
    return ReadError::OutOfRange;
  }
  const size_t maxLength = reader_.options().maxStringLength;
  const size_t size = std::min(
      static_cast<size_t>(length), maxLength * kMaxUtf8BytesPerCodePoint);
  auto bytes = reader_.readRaw(utf8, size);
  if (!bytes) {
    return bytes.error();
  }

  // Re-validate, the cache is target memory like everything else.
  std::string out;
  const auto& in = *bytes;
  size_t ii = 0;
  for (size_t emitted = 0; ii < in.size() && emitted < maxLength; ++emitted) {
    const uint8_t lead = in[ii];
    uint32_t codePoint;
    size_t len;
    if (lead < 0x80) {
      codePoint = lead;
      len = 1;
    } else if ((lead & 0xE0) == 0xC0) {
      codePoint = lead & 0x1F;
      len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      codePoint = lead & 0x0F;
      len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      codePoint = lead & 0x07;
      len = 4;
    } else {
      appendUtf8(out, kReplacementCharacter);
      ++ii;
      continue;
    }
    if (ii + len > in.size()) {
      appendUtf8(out, kReplacementCharacter);
      break;
    }
    bool valid = true;
    for (size_t kk = 1; kk < len; ++kk) {
      const uint8_t cont = in[ii + kk];
      if ((cont & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      codePoint = (codePoint << 6) | (cont & 0x3F);
    }
    if (!valid) {
      appendUtf8(out, kReplacementCharacter);
      ++ii;
      continue;
    }
    appendUtf8(out, codePoint);
    ii += len;
  }
  return out;
}

ReadResult<std::vector<uint8_t>> StringDecoder::decodeBytes(
    Address address,
    size_t maxSize) const {
  if (address == 0) {
    return ReadError::Unmapped;
  }
  auto header = reader_.readStruct(address, StructKind::Bytes);
  if (!header) {
    return header.error();
  }
  auto size = header->getSigned(Field::Bytes_size);
  if (!size) {
    return size.error();
  }
  if (*size < 0) {
    return ReadError::OutOfRange;
  }
  if (static_cast<size_t>(*size) > maxSize) {
    pyremote_lib_print(
        PYREMOTE_LIB_INFO,
        fmt::format(
            "Bytes object at {:#x} is {} bytes, limit is {}",
            address,
            *size,
            maxSize)
            .c_str());
    return ReadError::OutOfRange;
  }
  auto data = reader_.fieldAddress(address, Field::Bytes_data);
  if (!data) {
    return data.error();
  }
  return reader_.readRaw(*data, static_cast<size_t>(*size));
}

} // namespace pyremote::python
