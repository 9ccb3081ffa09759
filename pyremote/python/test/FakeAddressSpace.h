// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <map>
#include <stdexcept>
#include <vector>

#include "pyremote/include/IRemoteReader.h"

namespace pyremote::fake {

// In-memory stand-in for a target process. Memory is a set of zero-filled
// regions separated by unmapped gaps; reads that start outside every region
// fail with -EFAULT and reads that run off the end of a region are short.
class FakeAddressSpace : public IRemoteReader {
 public:
  static constexpr uintptr_t kBaseAddress = 0x7f0000000000;
  static constexpr uintptr_t kGap = 0x1000;

  uintptr_t allocate(size_t size) {
    const uintptr_t address = next_;
    regions_[address] = std::vector<uint8_t>(size);
    next_ += ((size + 15) & ~uintptr_t{15}) + kGap;
    return address;
  }

  void write(uintptr_t address, const void* data, size_t len) {
    auto it = findRegion(address);
    if (it == regions_.end() ||
        address - it->first + len > it->second.size()) {
      throw std::out_of_range("write outside of allocated memory");
    }
    std::memcpy(it->second.data() + (address - it->first), data, len);
  }

  template <typename T>
  void writeValue(uintptr_t address, T value) {
    write(address, &value, sizeof(value));
  }

  // Removes the region containing `address`.
  void unmap(uintptr_t address) {
    auto it = findRegion(address);
    if (it != regions_.end()) {
      regions_.erase(it);
    }
  }

  ssize_t read(uintptr_t address, void* dest, size_t len) const override {
    ++reads_;
    auto it = findRegion(address);
    if (it == regions_.end()) {
      return -EFAULT;
    }
    const size_t available = it->second.size() - (address - it->first);
    const size_t copied = std::min(len, available);
    std::memcpy(dest, it->second.data() + (address - it->first), copied);
    return static_cast<ssize_t>(copied);
  }

  size_t readCount() const {
    return reads_.load();
  }

 private:
  using Regions = std::map<uintptr_t, std::vector<uint8_t>>;

  Regions::const_iterator findRegion(uintptr_t address) const {
    auto it = regions_.upper_bound(address);
    if (it == regions_.begin()) {
      return regions_.end();
    }
    --it;
    if (address - it->first >= it->second.size()) {
      return regions_.end();
    }
    return it;
  }

  Regions::iterator findRegion(uintptr_t address) {
    auto it = regions_.upper_bound(address);
    if (it == regions_.begin()) {
      return regions_.end();
    }
    --it;
    if (address - it->first >= it->second.size()) {
      return regions_.end();
    }
    return it;
  }

  Regions regions_;
  uintptr_t next_{kBaseAddress};
  mutable std::atomic<size_t> reads_{0};
};

} // namespace pyremote::fake
