// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <atomic>

#include "pyremote/python/include/FieldReader.h"
#include "pyremote/python/include/PyStackStructs.h"
#include "pyremote/python/include/SourceLocationResolver.h"

namespace pyremote::python {

/*
 * FrameWalker follows a thread's frame chain from the innermost frame
 * outwards and resolves each frame to a source location.
 *
 * The walk stops at a null back pointer, at an address it has already
 * visited, at WalkerOptions::maxStackDepth frames, at the first frame that
 * cannot be read, or when cancelled. Frames collected until then are kept
 * and the reason is recorded in CallStack::status.
 */
class FrameWalker {
 public:
  explicit FrameWalker(
      const FieldReader& reader,
      const std::atomic<bool>* cancelled = nullptr);

  // Snapshot of the frame at `frame` with the instruction position converted
  // to a byte offset into the code object's bytecode.
  ReadResult<FrameHandle> readFrame(Address frame) const;

  CallStack walk(const ThreadStateHandle& thread) const;

 private:
  bool isCancelled() const {
    return cancelled_ != nullptr && cancelled_->load(std::memory_order_relaxed);
  }

  ResolvedFrame placeholder(size_t depth) const;

  const FieldReader& reader_;
  SourceLocationResolver resolver_;
  const std::atomic<bool>* cancelled_;
};

} // namespace pyremote::python
