#pragma once

/**
 * @file host.h
 * @brief Host syscalls used by the program
 *
 * Implemented by the platform: platform/sbf forwards to the runtime's
 * syscalls, tests link tests/mock_host.cpp.
 */

#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Append one line to the invocation's program log.
   * @param msg  Message bytes (not required to be NUL-terminated).
   * @param len  Message length in bytes.
   */
  void tally_host_log(const char *msg, uint64_t len);

#ifdef __cplusplus
}
#endif
