// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/SourceLocationResolver.h"

#include <utility>

#include <fmt/format.h>
#include "pyremote/python/include/PyLineTable.h"
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::python {

SourceLocationResolver::SourceLocationResolver(const FieldReader& reader)
    : reader_(reader), strings_(reader) {}

ReadResult<CodeObjectHandle> SourceLocationResolver::readCode(
    Address code) const {
  const auto& layout = reader_.layout();
  auto snapshot = checkSupported(
      reader_.readStruct(code, StructKind::Code), layout, Field::Code_name);
  if (!snapshot) {
    return snapshot.error();
  }

  auto name = checkSupported(
      snapshot->getPointer(Field::Code_name), layout, Field::Code_name);
  auto filename = checkSupported(
      snapshot->getPointer(Field::Code_filename), layout, Field::Code_filename);
  auto firstLine = checkSupported(
      snapshot->getSigned(Field::Code_firstlineno),
      layout,
      Field::Code_firstlineno);
  auto lineTable = checkSupported(
      snapshot->getPointer(Field::Code_linetable),
      layout,
      Field::Code_linetable);
  if (!name || !filename || !lineTable) {
    return ReadError::OutOfRange;
  }
  if (!firstLine) {
    return firstLine.error();
  }

  CodeObjectHandle handle;
  handle.address = code;
  handle.name = *name;
  handle.filename = *filename;
  handle.firstLine = static_cast<int32_t>(*firstLine);
  handle.lineTable = *lineTable;
  return handle;
}

std::pair<int32_t, bool> SourceLocationResolver::resolveLine(
    const CodeObjectHandle& code,
    int64_t instructionOffset) const {
  if (instructionOffset <= 0) {
    return {code.firstLine, true};
  }
  auto table = strings_.decodeBytes(code.lineTable, kMaxLineTableSize);
  if (!table) {
    pyremote_lib_print(
        PYREMOTE_LIB_DEBUG,
        fmt::format(
            "Failed to read line table at {:#x} of code object {:#x}: {}",
            code.lineTable,
            code.address,
            readErrorName(table.error()))
            .c_str());
    return {code.firstLine, false};
  }
  PyLineTable lineTable(
      code.firstLine,
      std::move(table).value(),
      reader_.layout().lineTableFormat);
  return {lineTable.getLineForOffset(instructionOffset), true};
}

SourceLocation SourceLocationResolver::resolve(
    const CodeObjectHandle& code,
    int64_t instructionOffset) const {
  const auto& placeholder = reader_.options().unresolvedName;
  SourceLocation location;

  auto name = strings_.decode(code.name);
  if (name) {
    location.function = std::move(name).value();
  } else {
    location.function = placeholder;
    location.complete = false;
  }

  auto file = strings_.decode(code.filename);
  if (file) {
    location.file = std::move(file).value();
  } else {
    location.file = placeholder;
    location.complete = false;
  }

  auto [line, lineOk] = resolveLine(code, instructionOffset);
  location.line = line;
  location.complete = location.complete && lineOk;
  return location;
}

ReadResult<SourceLocation> SourceLocationResolver::resolve(
    Address code,
    int64_t instructionOffset) const {
  auto handle = readCode(code);
  if (!handle) {
    return handle.error();
  }
  return resolve(*handle, instructionOffset);
}

} // namespace pyremote::python
