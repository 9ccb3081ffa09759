// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>

#include "pyremote/python/include/FieldReader.h"
#include "pyremote/python/include/PyStackStructs.h"

namespace pyremote::python {

struct ListWalkResult {
  size_t count{0};
  // Elements past this point may exist but were not visited.
  bool partial{false};
  bool cycleDetected{false};
  // The callback returned BREAK.
  bool stopped{false};
  std::optional<ReadError> error;
};

using ThreadStateCallback =
    std::function<IterControl(const ThreadStateHandle&)>;
using InterpreterCallback = std::function<IterControl(Address)>;

/*
 * Walks the linked lists hanging off PyInterpreterState. Every element is
 * read once; a repeated address ends the walk (the target may have relinked
 * the list while it was being read).
 */
class InterpreterEnumerator {
 public:
  explicit InterpreterEnumerator(
      const FieldReader& reader,
      const std::atomic<bool>* cancelled = nullptr);

  ListWalkResult iterateThreads(
      Address interpreterState,
      const ThreadStateCallback& callback) const;

  ThreadEnumeration enumerateThreads(Address interpreterState) const;

  // Follows PyInterpreterState.next starting at `head`, the main interpreter.
  ListWalkResult iterateInterpreters(
      Address head,
      const InterpreterCallback& callback) const;

  ReadResult<ThreadStateHandle> readThreadState(Address threadState) const;

 private:
  bool isCancelled() const {
    return cancelled_ != nullptr && cancelled_->load(std::memory_order_relaxed);
  }

  const FieldReader& reader_;
  const std::atomic<bool>* cancelled_;
};

} // namespace pyremote::python
