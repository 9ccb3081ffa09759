// Copyright (c) Meta Platforms, Inc. and affiliates.

#ifndef __PYREMOTE_LIB_LOGGING_H
#define __PYREMOTE_LIB_LOGGING_H

extern "C" {

enum pyremote_lib_print_level {
  PYREMOTE_LIB_WARN,
  PYREMOTE_LIB_INFO,
  PYREMOTE_LIB_DEBUG,
};

typedef int (*pyremote_lib_print_fn_t)(
    enum pyremote_lib_print_level level,
    const char*);

/**
 * @brief **pyremote_lib_set_print()** sets user-provided log callback
 * function to be used for pyremote warnings and informational messages.
 * If the user callback is not set, messages are not logged.
 * @param fn The log print function. NULL by default and does not print
 * anything.
 * @return Pointer to old print function.
 *
 * This function is thread-safe.
 */
pyremote_lib_print_fn_t pyremote_lib_set_print(pyremote_lib_print_fn_t fn);
}

#endif /* __PYREMOTE_LIB_LOGGING_H */
