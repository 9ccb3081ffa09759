// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/LayoutDescriptor.h"

#include <algorithm>
#include <iterator>
#include <limits>

namespace pyremote::python {

#define PYREMOTE_STRINGIFY_HELPER(x) #x
#define PYREMOTE_STRINGIFY(x) PYREMOTE_STRINGIFY_HELPER(x)

namespace {

#define PYREMOTE_FIELD_NAME(kind, name) PYREMOTE_STRINGIFY(name),
constexpr const char* kFieldNames[] = {
    PYREMOTE_LAYOUT_FIELDS(PYREMOTE_FIELD_NAME)};
#undef PYREMOTE_FIELD_NAME

#define PYREMOTE_FIELD_KIND(kind, name) StructKind::kind,
constexpr StructKind kFieldKinds[] = {
    PYREMOTE_LAYOUT_FIELDS(PYREMOTE_FIELD_KIND)};
#undef PYREMOTE_FIELD_KIND

static_assert(std::size(kFieldNames) == kFieldCount);
static_assert(std::size(kFieldKinds) == kFieldCount);

} // namespace

const char* fieldName(Field field) {
  return kFieldNames[static_cast<size_t>(field)];
}

StructKind structKindOf(Field field) {
  return kFieldKinds[static_cast<size_t>(field)];
}

const char* structKindName(StructKind kind) {
  switch (kind) {
    case StructKind::InterpreterState:
      return "InterpreterState";
    case StructKind::ThreadState:
      return "ThreadState";
    case StructKind::CFrame:
      return "CFrame";
    case StructKind::Frame:
      return "Frame";
    case StructKind::Code:
      return "Code";
    case StructKind::Bytes:
      return "Bytes";
    case StructKind::String:
      return "String";
    case StructKind::CompactString:
      return "CompactString";
  }
  return "Unknown";
}

const char* layoutName(PyLayoutId id) {
  switch (id) {
    case PyLayoutId::Py33:
      return "cpython-33";
    case PyLayoutId::Py36:
      return "cpython-36";
    case PyLayoutId::Py39:
      return "cpython-39";
    case PyLayoutId::Py310:
      return "cpython-310";
    case PyLayoutId::Py311:
      return "cpython-311";
  }
  return "cpython-unknown";
}

StructSpan LayoutDescriptor::span(StructKind kind) const {
  uintptr_t begin = std::numeric_limits<uintptr_t>::max();
  uintptr_t end = 0;
  for (size_t ii = 0; ii < kFieldCount; ++ii) {
    const auto& spec = fields[ii];
    if (kFieldKinds[ii] != kind || !spec.supported() ||
        spec.rule == DecodeRule::InlineData) {
      continue;
    }
    begin = std::min(begin, spec.offset);
    end = std::max(end, spec.offset + spec.width);
  }
  if (end == 0) {
    return StructSpan{};
  }
  return StructSpan{begin, end};
}

} // namespace pyremote::python
