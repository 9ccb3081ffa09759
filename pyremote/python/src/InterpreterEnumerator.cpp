// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/InterpreterEnumerator.h"

#include <unordered_set>

#include <fmt/format.h>
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::python {

InterpreterEnumerator::InterpreterEnumerator(
    const FieldReader& reader,
    const std::atomic<bool>* cancelled)
    : reader_(reader), cancelled_(cancelled) {}

ReadResult<ThreadStateHandle> InterpreterEnumerator::readThreadState(
    Address threadState) const {
  const auto& layout = reader_.layout();
  auto snapshot = checkSupported(
      reader_.readStruct(threadState, StructKind::ThreadState),
      layout,
      Field::ThreadState_next);
  if (!snapshot) {
    return snapshot.error();
  }

  auto next = checkSupported(
      snapshot->getPointer(Field::ThreadState_next),
      layout,
      Field::ThreadState_next);
  auto threadId = checkSupported(
      snapshot->getUnsigned(Field::ThreadState_thread_id),
      layout,
      Field::ThreadState_thread_id);
  if (!next) {
    return next.error();
  }
  if (!threadId) {
    return threadId.error();
  }

  ThreadStateHandle handle;
  handle.address = threadState;
  handle.next = *next;
  handle.threadId = *threadId;

  if (layout.threadFrameLink == ThreadFrameLink::Direct) {
    auto frame = checkSupported(
        snapshot->getPointer(Field::ThreadState_frame),
        layout,
        Field::ThreadState_frame);
    if (!frame) {
      return frame.error();
    }
    handle.frame = *frame;
    return handle;
  }

  auto cframe = checkSupported(
      snapshot->getPointer(Field::ThreadState_cframe),
      layout,
      Field::ThreadState_cframe);
  if (!cframe) {
    return cframe.error();
  }
  if (*cframe == 0) {
    return handle;
  }
  auto frame = checkSupported(
      reader_.readUnsigned(*cframe, Field::CFrame_current_frame),
      layout,
      Field::CFrame_current_frame);
  if (frame) {
    handle.frame = *frame;
  } else {
    pyremote_lib_print(
        PYREMOTE_LIB_DEBUG,
        fmt::format(
            "Failed to read current frame of thread {:#x} through cframe {:#x}: "
            "{}",
            threadState,
            *cframe,
            readErrorName(frame.error()))
            .c_str());
    handle.frameUnavailable = true;
  }
  return handle;
}

ListWalkResult InterpreterEnumerator::iterateThreads(
    Address interpreterState,
    const ThreadStateCallback& callback) const {
  ListWalkResult result;
  const auto& layout = reader_.layout();
  auto head = checkSupported(
      reader_.readUnsigned(
          interpreterState, Field::InterpreterState_tstate_head),
      layout,
      Field::InterpreterState_tstate_head);
  if (!head) {
    pyremote_lib_print(
        PYREMOTE_LIB_INFO,
        fmt::format(
            "Failed to read thread list of interpreter {:#x}: {}",
            interpreterState,
            readErrorName(head.error()))
            .c_str());
    result.partial = true;
    result.error = head.error();
    return result;
  }

  const size_t maxThreads = reader_.options().maxThreads;
  std::unordered_set<Address> visited;
  for (Address addr = *head; addr != 0;) {
    if (isCancelled()) {
      result.partial = true;
      break;
    }
    if (result.count >= maxThreads) {
      pyremote_lib_print(
          PYREMOTE_LIB_WARN,
          fmt::format(
              "Interpreter {:#x} has more than {} threads, ignoring the rest",
              interpreterState,
              maxThreads)
              .c_str());
      result.partial = true;
      break;
    }
    if (!visited.insert(addr).second) {
      pyremote_lib_print(
          PYREMOTE_LIB_INFO,
          fmt::format(
              "Thread list of interpreter {:#x} loops back to {:#x}",
              interpreterState,
              addr)
              .c_str());
      result.cycleDetected = true;
      break;
    }

    auto thread = readThreadState(addr);
    if (!thread) {
      pyremote_lib_print(
          PYREMOTE_LIB_DEBUG,
          fmt::format(
              "Failed to read thread state {:#x}: {}",
              addr,
              readErrorName(thread.error()))
              .c_str());
      result.partial = true;
      result.error = thread.error();
      break;
    }
    if (thread->frameUnavailable) {
      result.partial = true;
    }
    ++result.count;
    if (callback(*thread) == IterControl::BREAK) {
      result.stopped = true;
      break;
    }
    addr = thread->next;
  }
  return result;
}

ThreadEnumeration InterpreterEnumerator::enumerateThreads(
    Address interpreterState) const {
  ThreadEnumeration enumeration;
  auto result = iterateThreads(
      interpreterState, [&](const ThreadStateHandle& thread) {
        enumeration.threads.push_back(thread);
        return IterControl::CONTINUE;
      });
  enumeration.partial = result.partial;
  enumeration.cycleDetected = result.cycleDetected;
  enumeration.error = result.error;
  return enumeration;
}

ListWalkResult InterpreterEnumerator::iterateInterpreters(
    Address head,
    const InterpreterCallback& callback) const {
  ListWalkResult result;
  const auto& layout = reader_.layout();
  const size_t maxInterpreters = reader_.options().maxThreads;
  std::unordered_set<Address> visited;
  for (Address addr = head; addr != 0;) {
    if (isCancelled() || result.count >= maxInterpreters) {
      result.partial = true;
      break;
    }
    if (!visited.insert(addr).second) {
      result.cycleDetected = true;
      break;
    }
    ++result.count;
    if (callback(addr) == IterControl::BREAK) {
      result.stopped = true;
      break;
    }

    auto next = checkSupported(
        reader_.readUnsigned(addr, Field::InterpreterState_next),
        layout,
        Field::InterpreterState_next);
    if (!next) {
      pyremote_lib_print(
          PYREMOTE_LIB_DEBUG,
          fmt::format(
              "Failed to read next interpreter of {:#x}: {}",
              addr,
              readErrorName(next.error()))
              .c_str());
      result.partial = true;
      result.error = next.error();
      break;
    }
    addr = *next;
  }
  return result;
}

} // namespace pyremote::python
