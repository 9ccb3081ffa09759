// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/layouts/PyLayouts.h"

namespace pyremote::python {

extern const LayoutDescriptor kPy39Layout = [] {
  LayoutDescriptor layout;
  layout.id = PyLayoutId::Py39;
  layout.versionMajor = 3;
  layout.versionMinor = 9;
  layout.lineTableFormat = LineTableFormat::LnotabSigned;
  layout.instructionEncoding = InstructionEncoding::LastiBytes;
  layout.threadFrameLink = ThreadFrameLink::Direct;

  layout.set(Field::InterpreterState_next, pointerAt(0));
  layout.set(Field::InterpreterState_tstate_head, pointerAt(8));

  layout.set(Field::ThreadState_next, pointerAt(8));
  layout.set(Field::ThreadState_frame, pointerAt(24));
  layout.set(Field::ThreadState_thread_id, unsignedAt(176, 8));

  layout.set(Field::Frame_back, pointerAt(24));
  layout.set(Field::Frame_code, pointerAt(32));
  layout.set(Field::Frame_lasti, signedAt(104, 4));

  layout.set(Field::Code_firstlineno, signedAt(40, 4));
  layout.set(Field::Code_filename, stringAt(104));
  layout.set(Field::Code_name, stringAt(112));
  layout.set(Field::Code_linetable, pointerAt(120));

  setObjectLayout(layout);
  return layout;
}();

} // namespace pyremote::python
