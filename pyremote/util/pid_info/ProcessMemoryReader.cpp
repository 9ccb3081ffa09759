// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/util/pid_info/ProcessMemoryReader.h"

#include <sys/uio.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include <fmt/format.h>
#include "pyremote/util/PyRemoteLogger.h"

namespace pyremote::pid_info {

namespace fs = std::filesystem;

ProcessMemoryReader::ProcessMemoryReader(pid_t pid, std::string rootDir)
    : pid_(pid), rootDir_(std::move(rootDir)) {}

fs::path ProcessMemoryReader::getProcfsPath(const std::string& option) const {
  // The need to add rootDir_ is for Unit Tests.
  fs::path procfs = rootDir_.empty() ? fs::path("/proc") : rootDir_ / "proc";
  return (procfs / std::to_string(pid_) / option).lexically_normal();
}

bool ProcessMemoryReader::isAlive() const {
  std::error_code ec{};
  return fs::exists(getProcfsPath("status"), ec);
}

ssize_t ProcessMemoryReader::readMemoryFromPid(
    pid_t pid,
    void* dest,
    const void* src,
    size_t len) {
  struct iovec local[1];
  struct iovec remote[1];
  local[0].iov_base = dest;
  local[0].iov_len = len;
  remote[0].iov_base = const_cast<void*>(src);
  remote[0].iov_len = len;
  ssize_t ret = ::process_vm_readv(pid, local, 1, remote, 1, 0);
  if (ret < 0) {
    return -errno;
  }
  return ret;
}

ssize_t ProcessMemoryReader::read(uintptr_t address, void* dest, size_t len)
    const {
  if (len == 0) {
    return 0;
  }
  return readMemoryFromPid(
      pid_, dest, reinterpret_cast<const void*>(address), len);
}

bool ProcessMemoryReader::readMemoryMapLine(
    const std::string& line,
    MemoryMapping& mapping) {
  // "start-end perms offset major:minor inode   name", where the name may be
  // missing. See show_map_vma() in fs/proc/task_mmu.c.
  char perms[5] = {};
  unsigned int devMajor = 0;
  unsigned int devMinor = 0;
  unsigned long inode = 0;
  int nameStart = -1;
  const int fields = std::sscanf(
      line.c_str(),
      "%lx-%lx %4s %llx %x:%x %lu %n",
      &mapping.startAddr,
      &mapping.endAddr,
      perms,
      &mapping.fileOffset,
      &devMajor,
      &devMinor,
      &inode,
      &nameStart);
  if (fields < 7 || std::strlen(perms) != 4) {
    return false;
  }

  mapping.readable = perms[0] == 'r';
  mapping.writable = perms[1] == 'w';
  mapping.executable = perms[2] == 'x';
  mapping.shared = perms[3] == 's';
  mapping.devMajor = devMajor;
  mapping.devMinor = devMinor;
  mapping.inode = inode;
  mapping.name = nameStart >= 0 && static_cast<size_t>(nameStart) < line.size()
      ? line.substr(nameStart)
      : std::string();
  return true;
}

bool ProcessMemoryReader::iterateAllMemoryMappings(
    const MemoryMappingCallback& callback) const {
  std::ifstream maps(getProcfsPath("maps"));
  if (!maps.is_open()) {
    pyremote_lib_print(
        PYREMOTE_LIB_DEBUG,
        fmt::format("Failed to open memory maps of process {}", pid_).c_str());
    return false;
  }

  std::string line;
  while (std::getline(maps, line)) {
    MemoryMapping mapping;
    if (!readMemoryMapLine(line, mapping)) {
      pyremote_lib_print(
          PYREMOTE_LIB_DEBUG,
          fmt::format(
              "Failed to parse memory mapping '{}' of process {}", line, pid_)
              .c_str());
      return false;
    }
    if (callback(mapping) == IterControl::BREAK) {
      break;
    }
  }
  return true;
}

std::optional<MemoryMapping> ProcessMemoryReader::findMapping(
    uintptr_t address) const {
  std::optional<MemoryMapping> found;
  iterateAllMemoryMappings([&](const MemoryMapping& mapping) {
    if (mapping.startAddr <= address && address < mapping.endAddr) {
      found = mapping;
      return IterControl::BREAK;
    }
    return IterControl::CONTINUE;
  });
  return found;
}

bool ProcessMemoryReader::isReadableAddress(uintptr_t address) const {
  auto mapping = findMapping(address);
  if (!mapping) {
    pyremote_lib_print(
        PYREMOTE_LIB_DEBUG,
        fmt::format("{:#x} is not mapped in process {}", address, pid_)
            .c_str());
    return false;
  }
  if (!mapping->readable) {
    pyremote_lib_print(
        PYREMOTE_LIB_DEBUG,
        fmt::format(
            "{:#x} is in non-readable mapping {:#x}-{:#x} of process {}",
            address,
            mapping->startAddr,
            mapping->endAddr,
            pid_)
            .c_str());
    return false;
  }
  return true;
}

} // namespace pyremote::pid_info
