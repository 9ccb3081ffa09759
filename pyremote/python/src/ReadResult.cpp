// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/ReadResult.h"

#include <fmt/format.h>

namespace pyremote::python {

const char* readErrorName(ReadError error) {
  switch (error) {
    case ReadError::Unmapped:
      return "Unmapped";
    case ReadError::OutOfRange:
      return "OutOfRange";
    case ReadError::UnsupportedField:
      return "UnsupportedField";
  }
  return "Unknown";
}

UnsupportedFieldError::UnsupportedFieldError(
    const LayoutDescriptor& layout,
    Field field)
    : UnsupportedVersionError(fmt::format(
          "Layout {} has no offset for {}.{}",
          layoutName(layout.id),
          structKindName(structKindOf(field)),
          fieldName(field))),
      field_(field) {}

} // namespace pyremote::python
