// Copyright (c) Meta Platforms, Inc. and affiliates.

#ifndef __PYREMOTE_IREMOTEREADER_H__
#define __PYREMOTE_IREMOTEREADER_H__

#include <sys/types.h>
#include <cstddef>
#include <cstdint>

namespace pyremote {

class IRemoteReader {
 public:
  virtual ~IRemoteReader() {}

  // Copy up to `len` bytes starting at `address` in the target address space
  // to `dest` (must be at least `len` bytes long).
  //
  // NOTE: There is no guarantee of atomicity. The target may mutate the data
  // while it is being read.
  //
  // Returns the number of bytes copied (which may be less than `len`) or a
  // negative errno value. -EFAULT means the address is not mapped.
  virtual ssize_t read(uintptr_t address, void* dest, size_t len) const = 0;
};

} // namespace pyremote

#endif
