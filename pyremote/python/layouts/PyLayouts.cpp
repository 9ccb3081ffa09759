// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/layouts/PyLayouts.h"

#include <re2/re2.h>
#include <fmt/format.h>

#include "pyremote/python/include/ReadResult.h"
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::python {

// Python's sys.implementation.cache_tag, e.g. "cpython-311".
static const RE2 kCacheTagRegex("cpython-(\\d)(\\d+)");
// "3.11", "3.11.4", "python3.11", "Python 3.9.18"
static const RE2 kVersionRegex("(\\d+)\\.(\\d+)");

void setObjectLayout(LayoutDescriptor& layout) {
  // PyBytesObject
  layout.set(Field::Bytes_size, signedAt(16, 8));
  layout.set(Field::Bytes_data, inlineAt(32));

  // PyASCIIObject
  layout.set(Field::String_length, signedAt(16, 8));
  layout.set(Field::String_state_interned, bitsAt(32, 0, 2));
  layout.set(Field::String_state_kind, bitsAt(32, 2, 3));
  layout.set(Field::String_state_compact, bitsAt(32, 5, 1));
  layout.set(Field::String_state_ascii, bitsAt(32, 6, 1));
  layout.set(Field::String_state_ready, bitsAt(32, 7, 1));
  layout.set(Field::String_wstr, pointerAt(40));
  layout.set(Field::String_ascii_data, inlineAt(48));

  // PyCompactUnicodeObject
  layout.set(Field::String_utf8_length, signedAt(48, 8));
  layout.set(Field::String_utf8, pointerAt(56));
  layout.set(Field::String_wstr_length, signedAt(64, 8));
  layout.set(Field::String_compact_data, inlineAt(72));

  // PyUnicodeObject
  layout.set(Field::String_data, pointerAt(72));
}

const LayoutDescriptor& getLayout(PyLayoutId id) {
  switch (id) {
    case PyLayoutId::Py33:
      return kPy33Layout;
    case PyLayoutId::Py36:
      return kPy36Layout;
    case PyLayoutId::Py39:
      return kPy39Layout;
    case PyLayoutId::Py310:
      return kPy310Layout;
    case PyLayoutId::Py311:
      return kPy311Layout;
  }
  throw UnsupportedVersionError(
      fmt::format("Unknown layout id {}", static_cast<int>(id)));
}

const LayoutDescriptor& selectLayout(std::string_view version) {
  int major = 0;
  int minor = 0;
  if (!RE2::FullMatch(version, kCacheTagRegex, &major, &minor) &&
      !RE2::PartialMatch(version, kVersionRegex, &major, &minor)) {
    throw UnsupportedVersionError(
        fmt::format("Cannot parse Python version from '{}'", version));
  }

  for (auto id :
       {PyLayoutId::Py33,
        PyLayoutId::Py36,
        PyLayoutId::Py39,
        PyLayoutId::Py310,
        PyLayoutId::Py311}) {
    const auto& layout = getLayout(id);
    if (layout.versionMajor == major && layout.versionMinor == minor) {
      pyremote_lib_print(
          PYREMOTE_LIB_INFO,
          fmt::format("Using layout {} for '{}'", layoutName(id), version)
              .c_str());
      return layout;
    }
  }

  pyremote_lib_print(
      PYREMOTE_LIB_WARN,
      fmt::format("No layout for Python {}.{} ('{}')", major, minor, version)
          .c_str());
  throw UnsupportedVersionError(fmt::format(
      "Python {}.{} is not supported, known layouts are 3.3, 3.6, 3.9, 3.10 "
      "and 3.11",
      major,
      minor));
}

static void requireField(const LayoutDescriptor& layout, Field field) {
  const auto& spec = layout.field(field);
  if (!spec.supported()) {
    throw UnsupportedFieldError(layout, field);
  }
  if (spec.rule == DecodeRule::InlineData) {
    return;
  }
  bool valid = spec.width > 0 && spec.width <= sizeof(uint64_t);
  if (spec.rule == DecodeRule::BitFlags) {
    valid = valid && spec.bitWidth > 0 &&
        spec.bitOffset + spec.bitWidth <= spec.width * 8;
  }
  if (!valid) {
    throw UnsupportedVersionError(fmt::format(
        "Layout {} describes {} with width {} bits [{}, +{})",
        layoutName(layout.id),
        fieldName(field),
        spec.width,
        spec.bitOffset,
        spec.bitWidth));
  }
}

void validateLayout(const LayoutDescriptor& layout) {
  for (auto field :
       {Field::InterpreterState_next,
        Field::InterpreterState_tstate_head,
        Field::ThreadState_next,
        Field::ThreadState_thread_id,
        Field::Frame_back,
        Field::Frame_code,
        Field::Code_firstlineno,
        Field::Code_filename,
        Field::Code_name,
        Field::Code_linetable,
        Field::Bytes_size,
        Field::Bytes_data,
        Field::String_length,
        Field::String_state_kind,
        Field::String_state_compact,
        Field::String_state_ascii,
        Field::String_state_ready,
        Field::String_wstr,
        Field::String_ascii_data,
        Field::String_utf8_length,
        Field::String_utf8,
        Field::String_wstr_length,
        Field::String_compact_data,
        Field::String_data}) {
    requireField(layout, field);
  }

  switch (layout.threadFrameLink) {
    case ThreadFrameLink::Direct:
      requireField(layout, Field::ThreadState_frame);
      break;
    case ThreadFrameLink::ViaCFrame:
      requireField(layout, Field::ThreadState_cframe);
      requireField(layout, Field::CFrame_current_frame);
      break;
  }

  switch (layout.instructionEncoding) {
    case InstructionEncoding::LastiBytes:
    case InstructionEncoding::LastiCodeUnits:
      requireField(layout, Field::Frame_lasti);
      break;
    case InstructionEncoding::PrevInstrPointer:
      requireField(layout, Field::Frame_prev_instr);
      requireField(layout, Field::Code_code_adaptive);
      break;
  }
}

std::ostream& operator<<(std::ostream& os, const LayoutDescriptor& layout) {
  os << "LayoutDescriptor " << layoutName(layout.id) << ":";
  for (size_t ii = 0; ii < kFieldCount; ++ii) {
    const auto field = static_cast<Field>(ii);
    const auto& spec = layout.field(field);
    os << "\n\t LayoutDescriptor." << fieldName(field) << " : ";
    if (!spec.supported()) {
      os << "unsupported";
      continue;
    }
    os << spec.offset;
    if (spec.rule == DecodeRule::BitFlags) {
      os << " bits [" << static_cast<int>(spec.bitOffset) << ", +"
         << static_cast<int>(spec.bitWidth) << ")";
    } else if (spec.rule != DecodeRule::InlineData) {
      os << " (" << spec.width << " bytes)";
    }
  }
  os << "\n";
  return os;
}

} // namespace pyremote::python
