// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <memory>
#include <mutex>
#include <utility>

#include "pyremote/include/IRemoteReader.h"

namespace pyremote {

/*
 * SerializedRemoteReader wraps an IRemoteReader that is not safe to call from
 * more than one thread at a time. Every read acquires a mutex before calling
 * into the wrapped reader, so a single reader can be shared by the sampler's
 * parallel stack walks.
 */
class SerializedRemoteReader : public IRemoteReader {
 private:
  template <class Function>
  ssize_t withReader(Function&& function) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return function(*reader_);
  }

 public:
  explicit SerializedRemoteReader(std::shared_ptr<const IRemoteReader> reader)
      : reader_(std::move(reader)) {}

  ssize_t read(uintptr_t address, void* dest, size_t len) const override {
    return withReader([&](const IRemoteReader& reader) {
      return reader.read(address, dest, len);
    });
  }

 private:
  std::shared_ptr<const IRemoteReader> reader_;
  mutable std::mutex mutex_; // for serializing access to reader_
};

} // namespace pyremote
