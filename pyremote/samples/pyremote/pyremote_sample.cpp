// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <fmt/core.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "pyremote/include/logging.h"
#include "pyremote/python/include/PyStackSampler.h"
#include "pyremote/python/layouts/PyLayouts.h"
#include "pyremote/util/pid_info/ProcessMemoryReader.h"

#include <unistd.h> // pid_t

namespace {

constexpr size_t kDefaultSampleCount = 1;
constexpr auto kSampleInterval = std::chrono::milliseconds(100);

class PyRemoteSample {
 public:
  PyRemoteSample(pid_t pid, uintptr_t interpreterState)
      : pid_(pid), interpreterState_(interpreterState) {}

  int run(const std::string& version, size_t sampleCount) {
    std::cout << "Profile PID: " << pid_ << "\n";

    auto reader =
        std::make_shared<pyremote::pid_info::ProcessMemoryReader>(pid_);
    if (!reader->isAlive()) {
      std::cerr << "Process " << pid_ << " does not exist\n";
      return 1;
    }
    if (!reader->isReadableAddress(interpreterState_)) {
      std::cerr << fmt::format(
          "{:#x} is not a readable address in process {}\n",
          interpreterState_,
          pid_);
      return 1;
    }

    pyremote::WalkerOptions options;
    options.walkThreads = std::max(1u, std::thread::hardware_concurrency() / 2);

    try {
      const auto& layout = pyremote::python::selectLayout(version);
      pyremote::python::PyStackSampler sampler(layout, reader, options);

      for (size_t ii = 0; ii < sampleCount; ++ii) {
        if (ii > 0) {
          std::this_thread::sleep_for(kSampleInterval);
        }
        printSample(ii, sampler.sample(interpreterState_));
      }
    } catch (const pyremote::python::UnsupportedVersionError& e) {
      std::cerr << "Cannot sample: " << e.what() << "\n";
      return 1;
    }
    return 0;
  }

 private:
  static void printSample(size_t index, const pyremote::python::Sample& s) {
    std::cout << fmt::format(
        "SAMPLE {} threads: {}{}\n",
        index,
        s.stacks.size(),
        s.threadsPartial ? " (thread list incomplete)" : "");

    for (const auto& stack : s.stacks) {
      std::cout << fmt::format(
          "Thread {} ({}):\n",
          stack.threadId,
          pyremote::python::stackStatusName(stack.status));
      for (const auto& frame : stack.frames) {
        std::cout << fmt::format(
            "    {} ({}:{})\n",
            frame.functionName,
            frame.fileName,
            frame.lineNumber);
      }
    }
    std::cout << "\n";
  }

  pid_t pid_;
  uintptr_t interpreterState_;
};

} // namespace

extern "C" {
int pyremote_lib_printer(
    enum pyremote_lib_print_level level,
    const char* msg) {
  switch (level) {
    case PYREMOTE_LIB_DEBUG:
      std::cout << "DEBUG: " << msg << "\n";
      break;
    case PYREMOTE_LIB_INFO:
      std::cout << "INFO: " << msg << "\n";
      break;
    case PYREMOTE_LIB_WARN:
      std::cout << "WARN: " << msg << "\n";
      break;
  }
  return 0;
}
}

int main(int argc, char** argv) {
  pyremote_lib_set_print(pyremote_lib_printer);

  if (argc < 4) {
    std::cout << "Usage: " << argv[0]
              << " <PID> <INTERPRETER_STATE_ADDR> <PYTHON_VERSION>"
              << " [SAMPLES]\n";
    return 1;
  }

  pid_t target = std::atoi(argv[1]);
  uintptr_t interpreterState = std::strtoull(argv[2], nullptr, 16);
  size_t sampleCount = kDefaultSampleCount;
  if (argc > 4) {
    sampleCount = std::strtoul(argv[4], nullptr, 10);
  }
  if (target <= 0 || interpreterState == 0) {
    std::cerr << "Invalid PID or interpreter state address\n";
    return 1;
  }

  PyRemoteSample sample(target, interpreterState);
  return sample.run(argv[3], sampleCount);
}
