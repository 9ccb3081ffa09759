// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/FrameWalker.h"

#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::python {

const char* stackStatusName(StackStatus status) {
  switch (status) {
    case StackStatus::Complete:
      return "Complete";
    case StackStatus::Partial:
      return "Partial";
    case StackStatus::CycleDetected:
      return "CycleDetected";
    case StackStatus::DepthExceeded:
      return "DepthExceeded";
  }
  return "Unknown";
}

FrameWalker::FrameWalker(
    const FieldReader& reader,
    const std::atomic<bool>* cancelled)
    : reader_(reader), resolver_(reader), cancelled_(cancelled) {}

ReadResult<FrameHandle> FrameWalker::readFrame(Address frame) const {
  const auto& layout = reader_.layout();
  auto snapshot = checkSupported(
      reader_.readStruct(frame, StructKind::Frame), layout, Field::Frame_back);
  if (!snapshot) {
    return snapshot.error();
  }

  auto back = checkSupported(
      snapshot->getPointer(Field::Frame_back), layout, Field::Frame_back);
  auto code = checkSupported(
      snapshot->getPointer(Field::Frame_code), layout, Field::Frame_code);
  if (!back) {
    return back.error();
  }
  if (!code) {
    return code.error();
  }

  FrameHandle handle;
  handle.address = frame;
  handle.back = *back;
  handle.code = *code;

  switch (layout.instructionEncoding) {
    case InstructionEncoding::LastiBytes:
    case InstructionEncoding::LastiCodeUnits: {
      auto lasti = checkSupported(
          snapshot->getSigned(Field::Frame_lasti), layout, Field::Frame_lasti);
      if (!lasti) {
        return lasti.error();
      }
      handle.instructionOffset = *lasti;
      if (layout.instructionEncoding == InstructionEncoding::LastiCodeUnits &&
          *lasti > 0) {
        handle.instructionOffset = *lasti * 2;
      }
      break;
    }
    case InstructionEncoding::PrevInstrPointer: {
      auto prevInstr = checkSupported(
          snapshot->getPointer(Field::Frame_prev_instr),
          layout,
          Field::Frame_prev_instr);
      if (!prevInstr) {
        return prevInstr.error();
      }
      const auto& bytecode = layout.field(Field::Code_code_adaptive);
      if (!bytecode.supported()) {
        throw UnsupportedFieldError(layout, Field::Code_code_adaptive);
      }
      if (*prevInstr == 0 || handle.code == 0) {
        handle.instructionOffset = -1;
      } else {
        handle.instructionOffset =
            static_cast<int64_t>(*prevInstr - (handle.code + bytecode.offset));
      }
      break;
    }
  }
  return handle;
}

ResolvedFrame FrameWalker::placeholder(size_t depth) const {
  ResolvedFrame frame;
  frame.functionName = reader_.options().unresolvedName;
  frame.fileName = reader_.options().unresolvedName;
  frame.lineNumber = 0;
  frame.depth = depth;
  frame.resolved = false;
  return frame;
}

CallStack FrameWalker::walk(const ThreadStateHandle& thread) const {
  CallStack stack;
  stack.threadId = thread.threadId;
  stack.threadState = thread.address;

  const size_t maxDepth = reader_.options().maxStackDepth;
  bool partial = thread.frameUnavailable;
  bool cycleDetected = false;
  bool depthExceeded = false;
  std::unordered_set<Address> visited;

  for (Address addr = thread.frame; addr != 0;) {
    if (isCancelled()) {
      partial = true;
      break;
    }
    if (stack.frames.size() >= maxDepth) {
      pyremote_lib_print(
          PYREMOTE_LIB_INFO,
          fmt::format(
              "Stack of thread {} is deeper than {} frames, truncating",
              thread.threadId,
              maxDepth)
              .c_str());
      depthExceeded = true;
      break;
    }
    if (!visited.insert(addr).second) {
      pyremote_lib_print(
          PYREMOTE_LIB_INFO,
          fmt::format(
              "Stack of thread {} loops back to frame {:#x}",
              thread.threadId,
              addr)
              .c_str());
      cycleDetected = true;
      break;
    }

    auto frame = readFrame(addr);
    if (!frame) {
      pyremote_lib_print(
          PYREMOTE_LIB_DEBUG,
          fmt::format(
              "Failed to read frame {:#x} of thread {}: {}",
              addr,
              thread.threadId,
              readErrorName(frame.error()))
              .c_str());
      partial = true;
      break;
    }

    const size_t depth = stack.frames.size();
    auto location = resolver_.resolve(frame->code, frame->instructionOffset);
    if (!location) {
      stack.frames.push_back(placeholder(depth));
      partial = true;
    } else {
      SourceLocation source = std::move(location).value();
      ResolvedFrame resolved;
      resolved.functionName = std::move(source.function);
      resolved.fileName = std::move(source.file);
      resolved.lineNumber = source.line;
      resolved.depth = depth;
      stack.frames.push_back(std::move(resolved));
      partial = partial || !source.complete;
    }
    addr = frame->back;
  }

  if (cycleDetected) {
    stack.status = StackStatus::CycleDetected;
  } else if (depthExceeded) {
    stack.status = StackStatus::DepthExceeded;
  } else if (partial) {
    stack.status = StackStatus::Partial;
  } else {
    stack.status = StackStatus::Complete;
  }
  return stack;
}

} // namespace pyremote::python
