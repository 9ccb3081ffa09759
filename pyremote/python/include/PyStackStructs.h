// Copyright (c) Meta Platforms, Inc. and affiliates.

#ifndef __PYREMOTE_PYSTACKSTRUCTS_H__
#define __PYREMOTE_PYSTACKSTRUCTS_H__

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pyremote/python/include/LayoutDescriptor.h"
#include "pyremote/python/include/ReadResult.h"

namespace pyremote::python {

enum IterControl : int { CONTINUE, BREAK };

struct ThreadStateHandle {
  Address address{0};
  Address next{0};
  // Innermost frame, 0 when the thread is not running Python code.
  Address frame{0};
  uint64_t threadId{0};
  // The frame link could not be read; `frame` is 0 but the thread may have
  // been running Python code.
  bool frameUnavailable{false};
};

struct FrameHandle {
  Address address{0};
  Address back{0};
  Address code{0};
  // Bytes into the code object's bytecode. Negative before the first
  // instruction has run.
  int64_t instructionOffset{0};
};

struct CodeObjectHandle {
  Address address{0};
  Address name{0};
  Address filename{0};
  int32_t firstLine{0};
  Address lineTable{0};
};

struct SourceLocation {
  std::string function;
  std::string file;
  int32_t line{0};
  // False if any part had to be substituted.
  bool complete{true};
};

struct ResolvedFrame {
  std::string functionName;
  std::string fileName;
  int32_t lineNumber{0};
  // 0 for the innermost frame.
  size_t depth{0};
  // False for placeholders of frames whose code object could not be read.
  bool resolved{true};
};

enum class StackStatus {
  Complete,
  Partial,
  CycleDetected,
  DepthExceeded,
};

const char* stackStatusName(StackStatus status);

struct CallStack {
  uint64_t threadId{0};
  Address threadState{0};
  // Set by PyStackSampler.
  Address interpreterState{0};
  // Innermost frame first.
  std::vector<ResolvedFrame> frames;
  StackStatus status{StackStatus::Complete};
};

struct ThreadEnumeration {
  std::vector<ThreadStateHandle> threads;
  bool partial{false};
  bool cycleDetected{false};
  // What stopped the walk early, if a read did.
  std::optional<ReadError> error;
};

struct Sample {
  std::vector<CallStack> stacks;
  bool threadsPartial{false};
  bool cancelled{false};
};

} // namespace pyremote::python

#endif
