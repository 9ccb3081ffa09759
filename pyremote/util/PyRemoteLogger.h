// Copyright (c) Meta Platforms, Inc. and affiliates.

#ifndef __PYREMOTE_LIB_LOGGER_H
#define __PYREMOTE_LIB_LOGGER_H

#include "pyremote/include/logging.h"

void pyremote_lib_print(enum pyremote_lib_print_level level, const char* msg);

#endif /* __PYREMOTE_LIB_LOGGER_H */
