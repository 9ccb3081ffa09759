// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#define PYREMOTE_UNSUPPORTED_FIELD_OFFSET 9999

namespace pyremote::python {

using Address = uintptr_t;

// Every structure of the target interpreter the walker reads from.
// String covers the PyASCIIObject header, CompactString the members that
// PyCompactUnicodeObject / PyUnicodeObject add after it.
enum class StructKind : uint8_t {
  InterpreterState,
  ThreadState,
  CFrame,
  Frame,
  Code,
  Bytes,
  String,
  CompactString,
};

// IMPORTANT: When adding a field here also describe it in every layout that
// has it (Py*Layout.cpp) and, if the walker needs it, in validateLayout().
#define PYREMOTE_LAYOUT_FIELDS(X)              \
  X(InterpreterState, InterpreterState_next)   \
  X(InterpreterState, InterpreterState_tstate_head)\
  X(ThreadState, ThreadState_next)             \
  X(ThreadState, ThreadState_frame)            \
  X(ThreadState, ThreadState_cframe)           \
  X(ThreadState, ThreadState_thread_id)        \
  X(CFrame, CFrame_current_frame)              \
  X(Frame, Frame_back)                         \
  X(Frame, Frame_code)                         \
  X(Frame, Frame_lasti)                        \
  X(Frame, Frame_prev_instr)                   \
  X(Code, Code_firstlineno)                    \
  X(Code, Code_filename)                       \
  X(Code, Code_name)                           \
  X(Code, Code_linetable)                      \
  X(Code, Code_code_adaptive)                  \
  X(Bytes, Bytes_size)                         \
  X(Bytes, Bytes_data)                         \
  X(String, String_length)                     \
  X(String, String_state_interned)             \
  X(String, String_state_kind)                 \
  X(String, String_state_compact)              \
  X(String, String_state_ascii)                \
  X(String, String_state_ready)                \
  X(String, String_wstr)                       \
  X(String, String_ascii_data)                 \
  X(CompactString, String_utf8_length)         \
  X(CompactString, String_utf8)                \
  X(CompactString, String_wstr_length)         \
  X(CompactString, String_compact_data)        \
  X(CompactString, String_data)

enum class Field : uint8_t {
#define PYREMOTE_FIELD_ENUM(kind, name) name,
  PYREMOTE_LAYOUT_FIELDS(PYREMOTE_FIELD_ENUM)
#undef PYREMOTE_FIELD_ENUM
};

#define PYREMOTE_FIELD_COUNT(kind, name) +1
inline constexpr size_t kFieldCount =
    0 PYREMOTE_LAYOUT_FIELDS(PYREMOTE_FIELD_COUNT);
#undef PYREMOTE_FIELD_COUNT

const char* fieldName(Field field);
StructKind structKindOf(Field field);
const char* structKindName(StructKind kind);

enum class DecodeRule : uint8_t {
  Unsigned,
  Signed,
  Pointer,
  // Fixed-size byte array stored inline in the structure.
  CharArray,
  // Bits [bitOffset, bitOffset + bitWidth) of a `width` byte integer.
  BitFlags,
  // Pointer to a string object, decoded by the StringDecoder.
  String,
  // Inline variable-length data starting at `offset`. Only the address is
  // produced; the length comes from another field.
  InlineData,
};

struct FieldSpec {
  uintptr_t offset{PYREMOTE_UNSUPPORTED_FIELD_OFFSET};
  uint32_t width{0};
  DecodeRule rule{DecodeRule::Unsigned};
  uint8_t bitOffset{0};
  uint8_t bitWidth{0};

  bool supported() const {
    return offset != PYREMOTE_UNSUPPORTED_FIELD_OFFSET;
  }
};

constexpr FieldSpec pointerAt(uintptr_t offset) {
  return FieldSpec{offset, sizeof(uint64_t), DecodeRule::Pointer, 0, 0};
}

constexpr FieldSpec unsignedAt(uintptr_t offset, uint32_t width) {
  return FieldSpec{offset, width, DecodeRule::Unsigned, 0, 0};
}

constexpr FieldSpec signedAt(uintptr_t offset, uint32_t width) {
  return FieldSpec{offset, width, DecodeRule::Signed, 0, 0};
}

constexpr FieldSpec
bitsAt(uintptr_t offset, uint8_t bitOffset, uint8_t bitWidth) {
  return FieldSpec{offset, 1, DecodeRule::BitFlags, bitOffset, bitWidth};
}

constexpr FieldSpec charArrayAt(uintptr_t offset, uint32_t width) {
  return FieldSpec{offset, width, DecodeRule::CharArray, 0, 0};
}

constexpr FieldSpec stringAt(uintptr_t offset) {
  return FieldSpec{offset, sizeof(uint64_t), DecodeRule::String, 0, 0};
}

constexpr FieldSpec inlineAt(uintptr_t offset) {
  return FieldSpec{offset, 0, DecodeRule::InlineData, 0, 0};
}

// The closed set of interpreter builds with a known layout.
enum class PyLayoutId : uint8_t { Py33, Py36, Py39, Py310, Py311 };

const char* layoutName(PyLayoutId id);

// How code objects map bytecode offsets to line numbers.
enum class LineTableFormat : uint8_t {
  // co_lnotab, (offset delta, unsigned line delta) pairs. 3.3 - 3.5.
  Lnotab,
  // co_lnotab with signed line deltas. 3.6 - 3.9.
  LnotabSigned,
  // co_linetable, (offset delta, signed line delta) ranges. 3.10.
  Linetable310,
  // co_linetable, varint location table. 3.11+.
  LocationTable311,
};

// What the frame records about the current instruction.
enum class InstructionEncoding : uint8_t {
  // f_lasti, byte offset into co_code.
  LastiBytes,
  // f_lasti, index of the current code unit.
  LastiCodeUnits,
  // prev_instr, absolute pointer into the code object's inline bytecode
  // (Code_code_adaptive).
  PrevInstrPointer,
};

// How a thread state references its innermost frame.
enum class ThreadFrameLink : uint8_t {
  // ThreadState_frame
  Direct,
  // ThreadState_cframe -> CFrame_current_frame
  ViaCFrame,
};

struct StructSpan {
  uintptr_t begin{0};
  uintptr_t end{0};

  size_t size() const {
    return end - begin;
  }
};

// Field offsets, widths and decode rules for one interpreter build. Instances
// are immutable after construction; see PyLayouts.h for the supported set.
struct LayoutDescriptor {
  PyLayoutId id{PyLayoutId::Py33};
  int32_t versionMajor{0};
  int32_t versionMinor{0};
  LineTableFormat lineTableFormat{LineTableFormat::Lnotab};
  InstructionEncoding instructionEncoding{InstructionEncoding::LastiBytes};
  ThreadFrameLink threadFrameLink{ThreadFrameLink::Direct};

  std::array<FieldSpec, kFieldCount> fields{};

  const FieldSpec& field(Field f) const {
    return fields[static_cast<size_t>(f)];
  }

  void set(Field f, const FieldSpec& spec) {
    fields[static_cast<size_t>(f)] = spec;
  }

  // Smallest byte range covering every supported, non-inline field of `kind`.
  // Empty if the layout has no such field.
  StructSpan span(StructKind kind) const;
};

} // namespace pyremote::python
