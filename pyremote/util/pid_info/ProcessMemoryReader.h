// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <sys/types.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "pyremote/include/IRemoteReader.h"

namespace pyremote::pid_info {

struct MemoryMapping {
  uintptr_t startAddr;
  uintptr_t endAddr;
  unsigned long long fileOffset;
  bool readable;
  bool writable;
  bool executable;
  bool shared;
  dev_t devMajor;
  dev_t devMinor;
  ino_t inode;
  std::string name;
};

enum class IterControl { CONTINUE, BREAK };

using MemoryMappingCallback = std::function<IterControl(const MemoryMapping&)>;

// IRemoteReader for a live process, backed by process_vm_readv(2). Each read
// is a single system call so the reader can be shared between threads.
//
// The caller needs ptrace access to the target (same uid and a permissive
// ptrace_scope, or CAP_SYS_PTRACE).
class ProcessMemoryReader : public IRemoteReader {
 public:
  // The rootDir parameter is so that in Unit Tests the procfs lookups can run
  // under a temporary directory with mock files.
  explicit ProcessMemoryReader(pid_t pid, std::string rootDir = "");

  pid_t getPid() const {
    return pid_;
  }

  bool isAlive() const;

  ssize_t read(uintptr_t address, void* dest, size_t len) const override;

  // Returns number of bytes read or -errno on error.
  // @lint-ignore CLANGTIDY bugprone-easily-swappable-parameters
  static ssize_t
  readMemoryFromPid(pid_t pid, void* dest, const void* src, size_t len);

  // Parses one line of /proc/<pid>/maps.
  static bool readMemoryMapLine(
      const std::string& line,
      MemoryMapping& mapping);

  // Iterate over all memory mapping entries of the process.
  //
  // Returns true if we successfully iterated over all memory-mappings
  // or completed early because the callback returned BREAK.
  bool iterateAllMemoryMappings(const MemoryMappingCallback& callback) const;

  // The mapping containing `address`, if any.
  std::optional<MemoryMapping> findMapping(uintptr_t address) const;

  // Whether `address` lies in a readable mapping of the process. Used to
  // reject a bad interpreter state address before sampling.
  bool isReadableAddress(uintptr_t address) const;

  std::filesystem::path getProcfsPath(const std::string& option) const;

 private:
  const pid_t pid_;
  std::filesystem::path rootDir_;
};

} // namespace pyremote::pid_info
