#pragma once

/**
 * @file errors.h
 * @brief tally error codes for C
 *
 * C-compatible error code definitions generated from errors.def
 */

#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* Generate error code constants from errors.def */
#define ERR(name, val, exit_index, msg) static const int TALLY_ERR_##name = val;
#include "tally/errors.def"
#undef ERR

  /**
   * @brief Message text for an error code.
   * @param err  tally_err value.
   * @return Static string, "unknown error" for values not in errors.def.
   */
  const char *tally_err_message(int err);

  /**
   * @brief Host exit code for an error code.
   *
   * Builtin program errors are reported as (index << 32). Values not listed
   * in errors.def are reported as InvalidArgument.
   *
   * @param err  tally_err value.
   * @return 0 for OK, non-zero exit code otherwise.
   */
  uint64_t tally_err_exit_code(int err);

#ifdef __cplusplus
}
#endif
