// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/layouts/PyLayouts.h"

namespace pyremote::python {

// Objects/frameobject.h, Include/pystate.h and Include/code.h of CPython 3.3
// on x86_64. co_lnotab line deltas are unsigned.

extern const LayoutDescriptor kPy33Layout = [] {
  LayoutDescriptor layout;
  layout.id = PyLayoutId::Py33;
  layout.versionMajor = 3;
  layout.versionMinor = 3;
  layout.lineTableFormat = LineTableFormat::Lnotab;
  layout.instructionEncoding = InstructionEncoding::LastiBytes;
  layout.threadFrameLink = ThreadFrameLink::Direct;

  layout.set(Field::InterpreterState_next, pointerAt(0));
  layout.set(Field::InterpreterState_tstate_head, pointerAt(8));

  // PyThreadState has no prev member before 3.4.
  layout.set(Field::ThreadState_next, pointerAt(0));
  layout.set(Field::ThreadState_frame, pointerAt(16));
  layout.set(Field::ThreadState_thread_id, unsignedAt(144, 8));

  layout.set(Field::Frame_back, pointerAt(24));
  layout.set(Field::Frame_code, pointerAt(32));
  layout.set(Field::Frame_lasti, signedAt(120, 4));

  layout.set(Field::Code_filename, stringAt(96));
  layout.set(Field::Code_name, stringAt(104));
  layout.set(Field::Code_firstlineno, signedAt(112, 4));
  layout.set(Field::Code_linetable, pointerAt(120));

  setObjectLayout(layout);
  return layout;
}();

} // namespace pyremote::python
