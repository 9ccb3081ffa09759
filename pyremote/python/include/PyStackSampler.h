// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "pyremote/include/IRemoteReader.h"
#include "pyremote/include/WalkerOptions.h"
#include "pyremote/python/include/FieldReader.h"
#include "pyremote/python/include/LayoutDescriptor.h"
#include "pyremote/python/include/PyStackStructs.h"

namespace pyremote::python {

/*
 * One profiling session against one target process.
 *
 * The layout is validated on construction and fixed for the lifetime of the
 * sampler; a target running a different interpreter build needs a new
 * sampler. sample() may be called repeatedly. With
 * WalkerOptions::walkThreads > 1 the reader is called from several threads at
 * once, wrap it in a SerializedRemoteReader if it is not thread-safe.
 *
 * Throws UnsupportedVersionError (from the constructor or from sample()) if
 * the layout lacks a field the walk needs.
 */
class PyStackSampler {
 public:
  PyStackSampler(
      const LayoutDescriptor& layout,
      std::shared_ptr<const IRemoteReader> reader,
      WalkerOptions options = WalkerOptions());

  PyStackSampler(const PyStackSampler&) = delete;
  PyStackSampler& operator=(const PyStackSampler&) = delete;

  // Call stacks of every thread of the interpreter at `interpreterState`.
  Sample sample(Address interpreterState);

  // Like sample(), for the main interpreter and every sub-interpreter linked
  // after it. Stacks are grouped by interpreter, in list order.
  Sample sampleAllInterpreters(Address mainInterpreter);

  // Asks a running sample() to stop between frames. Stays in effect until
  // resetCancel().
  void cancel() {
    cancelled_.store(true);
  }

  void resetCancel() {
    cancelled_.store(false);
  }

  bool isCancelled() const {
    return cancelled_.load();
  }

  const LayoutDescriptor& layout() const {
    return layout_;
  }

  const WalkerOptions& options() const {
    return options_;
  }

 private:
  void sampleInterpreter(Address interpreterState, Sample& result);

  std::vector<CallStack> walkParallel(
      const std::vector<ThreadStateHandle>& threads) const;

  const LayoutDescriptor layout_;
  std::shared_ptr<const IRemoteReader> reader_;
  const WalkerOptions options_;
  std::atomic<bool> cancelled_{false};
  FieldReader fieldReader_;
};

} // namespace pyremote::python
