// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <ostream>
#include <string_view>

#include "pyremote/python/include/LayoutDescriptor.h"

namespace pyremote::python {

// CPython builds for x86_64 Linux, one per distinct layout of the structures
// the walker reads.

extern const LayoutDescriptor kPy33Layout;
extern const LayoutDescriptor kPy36Layout;
extern const LayoutDescriptor kPy39Layout;
extern const LayoutDescriptor kPy310Layout;
extern const LayoutDescriptor kPy311Layout;

const LayoutDescriptor& getLayout(PyLayoutId id);

// Accepts "cpython-311" cache tags, "python3.11" binary names and "3.11.4"
// version strings. Throws UnsupportedVersionError for any minor version other
// than 3.3, 3.6, 3.9, 3.10 and 3.11.
const LayoutDescriptor& selectLayout(std::string_view version);

// Throws UnsupportedFieldError if the layout lacks a field the walker needs,
// UnsupportedVersionError if a field cannot be decoded as described.
void validateLayout(const LayoutDescriptor& layout);

// PyBytesObject and PyUnicodeObject members, identical across the supported
// 3.x builds.
void setObjectLayout(LayoutDescriptor& layout);

std::ostream& operator<<(std::ostream& os, const LayoutDescriptor& layout);

} // namespace pyremote::python
