// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/layouts/PyLayouts.h"

namespace pyremote::python {

// From 3.11 on the thread state points at a _PyCFrame whose current_frame is
// the innermost _PyInterpreterFrame. Frames record prev_instr, a pointer into
// co_code_adaptive, instead of f_lasti.

extern const LayoutDescriptor kPy311Layout = [] {
  LayoutDescriptor layout;
  layout.id = PyLayoutId::Py311;
  layout.versionMajor = 3;
  layout.versionMinor = 11;
  layout.lineTableFormat = LineTableFormat::LocationTable311;
  layout.instructionEncoding = InstructionEncoding::PrevInstrPointer;
  layout.threadFrameLink = ThreadFrameLink::ViaCFrame;

  layout.set(Field::InterpreterState_next, pointerAt(0));
  // threads.head
  layout.set(Field::InterpreterState_tstate_head, pointerAt(16));

  layout.set(Field::ThreadState_next, pointerAt(8));
  layout.set(Field::ThreadState_cframe, pointerAt(56));
  layout.set(Field::ThreadState_thread_id, unsignedAt(152, 8));

  layout.set(Field::CFrame_current_frame, pointerAt(8));

  // _PyInterpreterFrame
  layout.set(Field::Frame_code, pointerAt(32));
  layout.set(Field::Frame_back, pointerAt(48));
  layout.set(Field::Frame_prev_instr, pointerAt(56));

  layout.set(Field::Code_firstlineno, signedAt(72, 4));
  layout.set(Field::Code_filename, stringAt(112));
  layout.set(Field::Code_name, stringAt(120));
  layout.set(Field::Code_linetable, pointerAt(136));
  layout.set(Field::Code_code_adaptive, inlineAt(184));

  setObjectLayout(layout);
  return layout;
}();

} // namespace pyremote::python
