// Copyright (c) Meta Platforms, Inc. and affiliates.

#ifndef __PYREMOTE_WALKER_OPTIONS_H__
#define __PYREMOTE_WALKER_OPTIONS_H__

#include <cstddef>
#include <string>

#define PYREMOTE_DEFAULT_MAX_STACK_DEPTH 256
#define PYREMOTE_DEFAULT_MAX_THREADS 4096
#define PYREMOTE_DEFAULT_MAX_STRING_LENGTH 65536

namespace pyremote {

struct WalkerOptions {
  // Frames beyond this depth are dropped and the stack is marked
  // DepthExceeded.
  size_t maxStackDepth = PYREMOTE_DEFAULT_MAX_STACK_DEPTH;

  // Thread states beyond this count are ignored and the enumeration is marked
  // partial.
  size_t maxThreads = PYREMOTE_DEFAULT_MAX_THREADS;

  // In code points. Longer strings are truncated.
  size_t maxStringLength = PYREMOTE_DEFAULT_MAX_STRING_LENGTH;

  // Number of sampler threads walking thread stacks. 1 walks serially on the
  // calling thread. Values > 1 require a thread-safe IRemoteReader.
  size_t walkThreads = 1;

  // Function and file name reported for frames whose code object could not be
  // read.
  std::string unresolvedName = "<unresolved>";
};

} // namespace pyremote

#endif
