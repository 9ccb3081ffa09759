// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <cstdint>
#include <utility>

#include "pyremote/python/include/FieldReader.h"
#include "pyremote/python/include/PyStackStructs.h"
#include "pyremote/python/include/StringDecoder.h"

namespace pyremote::python {

// Maps a code object and an instruction offset to {function, file, line}.
class SourceLocationResolver {
 public:
  explicit SourceLocationResolver(const FieldReader& reader);

  // Snapshot of the code object at `code`. Throws UnsupportedFieldError if the
  // layout lacks a code object field.
  ReadResult<CodeObjectHandle> readCode(Address code) const;

  // Never fails: unreadable names are replaced with
  // WalkerOptions::unresolvedName, an unreadable line table with the first
  // line, and the location is marked incomplete.
  SourceLocation resolve(
      const CodeObjectHandle& code,
      int64_t instructionOffset) const;

  // Fails only if the code object itself cannot be read.
  ReadResult<SourceLocation> resolve(Address code, int64_t instructionOffset)
      const;

 private:
  // Line number and whether the line table could be used.
  std::pair<int32_t, bool> resolveLine(
      const CodeObjectHandle& code,
      int64_t instructionOffset) const;

  const FieldReader& reader_;
  StringDecoder strings_;
};

} // namespace pyremote::python
