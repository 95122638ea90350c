#pragma once

#include <stdint.h>

/* Runtime syscalls resolved by the SBF loader at program load time. */

#ifdef __cplusplus
extern "C"
{
#endif

  /* Append a message to the transaction's program log */
  void sol_log_(const char *message, uint64_t len);

#ifdef __cplusplus
}
#endif

/* Input region handed to the entrypoint has no explicit length; the decoder
 * stops at the end of the serialized parameters. */
#define SBF_INPUT_LEN_UNBOUNDED UINT64_MAX
