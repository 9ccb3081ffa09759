// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "pyremote/util/PyRemoteLogger.h"
#include <errno.h>
#include "pyremote/include/logging.h"

static pyremote_lib_print_fn_t __pyremote_lib_printer = nullptr;

pyremote_lib_print_fn_t pyremote_lib_set_print(pyremote_lib_print_fn_t fn) {
  pyremote_lib_print_fn_t old_print_fn;

  old_print_fn =
      __atomic_exchange_n(&__pyremote_lib_printer, fn, __ATOMIC_RELAXED);

  return old_print_fn;
}

void pyremote_lib_print(enum pyremote_lib_print_level level, const char* msg) {
  int old_errno;
  pyremote_lib_print_fn_t print_fn;

  print_fn = __atomic_load_n(&__pyremote_lib_printer, __ATOMIC_RELAXED);
  if (!print_fn) {
    return;
  }

  old_errno = errno;

  print_fn(level, msg);

  errno = old_errno;
}
