// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/python/include/PyStackSampler.h"

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include "pyremote/python/include/FrameWalker.h"
#include "pyremote/python/include/InterpreterEnumerator.h"
#include "pyremote/python/layouts/PyLayouts.h"
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::python {

static const IRemoteReader& checkedReader(
    const std::shared_ptr<const IRemoteReader>& reader) {
  if (!reader) {
    throw std::invalid_argument("PyStackSampler requires a remote reader");
  }
  return *reader;
}

PyStackSampler::PyStackSampler(
    const LayoutDescriptor& layout,
    std::shared_ptr<const IRemoteReader> reader,
    WalkerOptions options)
    : layout_(layout),
      reader_(std::move(reader)),
      options_(std::move(options)),
      fieldReader_(layout_, checkedReader(reader_), options_) {
  validateLayout(layout_);
  pyremote_lib_print(
      PYREMOTE_LIB_INFO,
      fmt::format(
          "Sampling with layout {} ({} walker threads)",
          layoutName(layout_.id),
          std::max<size_t>(options_.walkThreads, 1))
          .c_str());
}

Sample PyStackSampler::sample(Address interpreterState) {
  Sample result;
  sampleInterpreter(interpreterState, result);
  result.cancelled = isCancelled();
  return result;
}

Sample PyStackSampler::sampleAllInterpreters(Address mainInterpreter) {
  Sample result;

  InterpreterEnumerator enumerator(fieldReader_, &cancelled_);
  std::vector<Address> interpreters;
  auto walk = enumerator.iterateInterpreters(
      mainInterpreter, [&](Address interpreterState) {
        interpreters.push_back(interpreterState);
        return IterControl::CONTINUE;
      });
  if (walk.partial || walk.cycleDetected) {
    pyremote_lib_print(
        PYREMOTE_LIB_INFO,
        fmt::format(
            "Enumerated {} interpreters from {:#x}, list incomplete",
            interpreters.size(),
            mainInterpreter)
            .c_str());
    result.threadsPartial = true;
  }

  for (Address interpreterState : interpreters) {
    if (isCancelled()) {
      break;
    }
    sampleInterpreter(interpreterState, result);
  }

  result.cancelled = isCancelled();
  return result;
}

void PyStackSampler::sampleInterpreter(
    Address interpreterState,
    Sample& result) {
  InterpreterEnumerator enumerator(fieldReader_, &cancelled_);
  auto threads = enumerator.enumerateThreads(interpreterState);
  if (threads.partial || threads.cycleDetected) {
    result.threadsPartial = true;
    pyremote_lib_print(
        PYREMOTE_LIB_INFO,
        fmt::format(
            "Enumerated {} threads of interpreter {:#x}, list incomplete",
            threads.threads.size(),
            interpreterState)
            .c_str());
  }

  std::vector<CallStack> stacks;
  if (options_.walkThreads > 1 && threads.threads.size() > 1) {
    stacks = walkParallel(threads.threads);
  } else {
    FrameWalker walker(fieldReader_, &cancelled_);
    for (const auto& thread : threads.threads) {
      if (isCancelled()) {
        break;
      }
      stacks.push_back(walker.walk(thread));
    }
  }

  for (auto& stack : stacks) {
    stack.interpreterState = interpreterState;
    result.stacks.push_back(std::move(stack));
  }
}

std::vector<CallStack> PyStackSampler::walkParallel(
    const std::vector<ThreadStateHandle>& threads) const {
  std::vector<std::optional<CallStack>> slots(threads.size());
  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  std::mutex errorMutex;
  std::exception_ptr error;

  auto worker = [&]() {
    FrameWalker walker(fieldReader_, &cancelled_);
    try {
      for (size_t ii = next++; ii < threads.size(); ii = next++) {
        if (cancelled_.load() || failed.load()) {
          break;
        }
        slots[ii] = walker.walk(threads[ii]);
      }
    } catch (...) {
      // Rethrown on the calling thread once all workers have stopped.
      std::lock_guard<std::mutex> guard(errorMutex);
      if (!error) {
        error = std::current_exception();
      }
      failed.store(true);
    }
  };

  const size_t workerCount = std::min(options_.walkThreads, threads.size());
  {
    // Joined on scope exit, including when a later spawn throws.
    std::vector<std::jthread> workers;
    workers.reserve(workerCount);
    try {
      for (size_t ii = 0; ii < workerCount; ++ii) {
        workers.emplace_back(worker);
      }
    } catch (const std::system_error& e) {
      pyremote_lib_print(
          PYREMOTE_LIB_WARN,
          fmt::format(
              "Started {} of {} walker threads ({}), walking the rest inline",
              workers.size(),
              workerCount,
              e.what())
              .c_str());
      worker();
    }
  }
  if (error) {
    std::rethrow_exception(error);
  }

  std::vector<CallStack> stacks;
  stacks.reserve(slots.size());
  for (auto& slot : slots) {
    if (slot) {
      stacks.push_back(std::move(*slot));
    }
  }
  return stacks;
}

} // namespace pyremote::python
