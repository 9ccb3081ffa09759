// Copyright (c) Meta Platforms, Inc. and affiliates.

#ifndef __PYREMOTE_PY_LINE_TABLE_H__
#define __PYREMOTE_PY_LINE_TABLE_H__

#include <sys/types.h>
#include <cstdint>
#include <functional>
#include <vector>

#include "pyremote/python/include/LayoutDescriptor.h"
#include "pyremote/python/include/PyStackStructs.h"

namespace pyremote::python {

// Line tables above this size are treated as corrupt and not read.
inline constexpr size_t kMaxLineTableSize = 1 * 1024 * 1024;

class PyLineTable {
 public:
  PyLineTable(int firstLine, std::vector<uint8_t> data, LineTableFormat format);

  PyLineTable(
      int firstLine,
      const void* data,
      size_t length,
      LineTableFormat format);

  // Source line of the instruction `byteOffset` bytes into the bytecode.
  // Offsets <= 0 map to the first line. A truncated or malformed table yields
  // the last line reached before the problem.
  int getLineForOffset(int64_t byteOffset) const;

  int firstLine() const {
    return firstLine_;
  }

 private:
  LineTableFormat format_;
  std::vector<uint8_t> data_;
  int firstLine_;

  int getLineForOffsetLnotab(uintptr_t offset, bool signedLineDelta) const;
  int getLineForOffset310(uintptr_t offset) const;
  int getLineForOffset311(uintptr_t offset) const;

  void parseLocationTable(
      const std::function<
          IterControl(uintptr_t start, uintptr_t end, int line)>& fn) const;
};

} // namespace pyremote::python

#endif // __PYREMOTE_PY_LINE_TABLE_H__
