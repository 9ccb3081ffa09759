// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "pyremote/python/include/LayoutDescriptor.h"

namespace pyremote::python {

enum class ReadError {
  // The address is not backed by a readable mapping in the target.
  Unmapped,
  // The decode rule needs more bytes than the reader returned, or the decoded
  // value is out of any plausible range.
  OutOfRange,
  // The active layout has no entry for the requested field.
  UnsupportedField,
};

const char* readErrorName(ReadError error);

// Value read from the target, or the reason it could not be read.
template <typename T>
class ReadResult {
 public:
  /* implicit */ ReadResult(T value) : value_(std::move(value)) {}
  /* implicit */ ReadResult(ReadError error) : value_(error) {}

  bool ok() const {
    return std::holds_alternative<T>(value_);
  }

  explicit operator bool() const {
    return ok();
  }

  const T& value() const& {
    return std::get<T>(value_);
  }

  T& value() & {
    return std::get<T>(value_);
  }

  T&& value() && {
    return std::get<T>(std::move(value_));
  }

  const T& operator*() const& {
    return value();
  }

  const T* operator->() const {
    return &value();
  }

  T valueOr(T fallback) const {
    return ok() ? value() : std::move(fallback);
  }

  ReadError error() const {
    return std::get<ReadError>(value_);
  }

 private:
  std::variant<T, ReadError> value_;
};

// The layout does not describe the target interpreter build. Fatal to the
// sampling session.
class UnsupportedVersionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A component needed a field the active layout does not have.
class UnsupportedFieldError : public UnsupportedVersionError {
 public:
  UnsupportedFieldError(const LayoutDescriptor& layout, Field field);

  Field field() const {
    return field_;
  }

 private:
  Field field_;
};

// Throws UnsupportedFieldError if `result` failed with UnsupportedField. Any
// other outcome is left to the caller.
template <typename T>
const ReadResult<T>& checkSupported(
    const ReadResult<T>& result,
    const LayoutDescriptor& layout,
    Field field) {
  if (!result.ok() && result.error() == ReadError::UnsupportedField) {
    throw UnsupportedFieldError(layout, field);
  }
  return result;
}

} // namespace pyremote::python
