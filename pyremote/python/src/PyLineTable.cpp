// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/PyLineTable.h"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::python {

PyLineTable::PyLineTable(
    int firstLine,
    std::vector<uint8_t> data,
    LineTableFormat format)
    : format_(format), data_(std::move(data)), firstLine_(firstLine) {}

PyLineTable::PyLineTable(
    int firstLine,
    const void* data,
    size_t length,
    LineTableFormat format)
    : format_(format),
      data_((const uint8_t*)data, (const uint8_t*)data + length),
      firstLine_(firstLine) {}

int PyLineTable::getLineForOffset(int64_t byteOffset) const {
  if (byteOffset <= 0) {
    return firstLine_;
  }
  uintptr_t offset = static_cast<uintptr_t>(byteOffset);

  switch (format_) {
    case LineTableFormat::Lnotab:
      return getLineForOffsetLnotab(offset, false);
    case LineTableFormat::LnotabSigned:
      return getLineForOffsetLnotab(offset, true);
    case LineTableFormat::Linetable310:
      return getLineForOffset310(offset);
    case LineTableFormat::LocationTable311:
      return getLineForOffset311(offset);
  }
  return firstLine_;
}

int PyLineTable::getLineForOffsetLnotab(
    uintptr_t offset,
    bool signedLineDelta) const {
  // https://github.com/python/cpython/blob/3.9/Objects/lnotab_notes.txt
  int line = firstLine_;
  uintptr_t addr = 0;

  // A trailing odd byte is an incomplete pair and is ignored.
  const size_t entryCount = data_.size() / 2;
  for (size_t ii = 0; ii < entryCount; ++ii) {
    addr += data_[2 * ii];
    if (addr > offset) {
      break;
    }
    const uint8_t lineDelta = data_[2 * ii + 1];
    line += signedLineDelta ? static_cast<int8_t>(lineDelta) : lineDelta;
  }
  return line;
}

int PyLineTable::getLineForOffset310(uintptr_t offset) const {
  // https://github.com/python/cpython/blob/3.10/Objects/lnotab_notes.txt#L57-L79
  int line = firstLine_;
  int best = firstLine_;
  uintptr_t start, end = 0;

  struct PyLineTableEntry {
    uint8_t offsetDelta;
    int8_t lineDelta;
  };
  const size_t entryCount = data_.size() / sizeof(PyLineTableEntry);
  const PyLineTableEntry* entries =
      reinterpret_cast<const PyLineTableEntry*>(data_.data());
  for (size_t ii = 0; ii < entryCount; ++ii) {
    auto& entry = entries[ii];

    if (entry.lineDelta == 0) {
      end += entry.offsetDelta;
      continue;
    }
    start = end;
    end = start + entry.offsetDelta;
    if (start > offset) {
      break;
    }
    if (entry.lineDelta == -128) {
      // No valid line number -- skip entry
      continue;
    }
    line += entry.lineDelta;
    if (end == start) {
      // Empty range, omit.
      continue;
    }
    best = line;
    if (offset < end) {
      return line;
    }
  }

  return best;
}

int PyLineTable::getLineForOffset311(uintptr_t offset) const {
  int ret = firstLine_;
  try {
    parseLocationTable([&](uintptr_t start, uintptr_t end, int line) {
      if (start > offset) {
        return IterControl::BREAK;
      }
      ret = line;
      if (offset < end) {
        return IterControl::BREAK;
      }
      return IterControl::CONTINUE;
    });
  } catch (const std::out_of_range& e) {
    pyremote_lib_print(
        PYREMOTE_LIB_INFO,
        fmt::format("Failed to parse location table: {}", e.what()).c_str());
  }
  return ret;
}

void PyLineTable::parseLocationTable(const std::function<IterControl(
                                         uintptr_t /* start */,
                                         uintptr_t /* end */,
                                         int /* line */)>& fn) const {
  // https://github.com/python/cpython/blob/3.11/Objects/locations.md

  auto itr = data_.begin(), end = data_.end();

  auto read = [&]() -> uint8_t {
    if (itr < end) {
      return *itr++;
    } else {
      throw std::out_of_range("line table read out of range");
    }
  };

  auto read_varint = [&]() -> unsigned int {
    uint8_t b = read();
    unsigned int val = b & 63;
    unsigned int shift = 0;
    while (b & 64) {
      b = read();
      shift += 6;
      if (shift >= 32) {
        throw std::out_of_range("line table varint too long");
      }
      val += static_cast<unsigned int>(b & 63) << shift;
    }
    return val;
  };

  auto read_signed_varint = [&]() -> int {
    unsigned int uval = read_varint();
    if (uval & 1) {
      return -static_cast<int>(uval >> 1);
    } else {
      return static_cast<int>(uval >> 1);
    }
  };

  int line_number = firstLine_;
  uintptr_t addr = 0;

  while (itr < end) {
    uint8_t byte = read();
    uintptr_t delta = (byte & 7) + 1;
    uint8_t code = (byte >> 3) & 15;

    int line_delta;
    if (code == 15) {
      // No location.
      line_delta = 0;
    } else if (code == 14) {
      line_delta = read_signed_varint();
      read_varint(); // end line
      read_varint(); // start column
      read_varint(); // end column
    } else if (code == 13) {
      line_delta = read_signed_varint();
    } else if (code >= 10 && code <= 12) {
      line_delta = code - 10;
      read(); // start column
      read(); // end column
    } else {
      line_delta = 0;
      read(); // column
    }
    line_number += line_delta;

    uintptr_t end_addr = addr + delta * 2;
    if (fn(addr, end_addr, line_number) != IterControl::CONTINUE) {
      break;
    }
    addr = end_addr;
  }
}

} // namespace pyremote::python
