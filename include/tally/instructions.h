#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** @file
   *  @brief Instruction discriminants for C.
   *
   *  Single leading byte, followed by a little-endian u32 amount.
   *  Keep numeric values stable once published.
   */

  typedef enum tally_insn_t
  {
#define INSN(name, val) TALLY_INSN_##name = val,
#include "tally/instructions.def"
#undef INSN
  } tally_insn_t;

#ifdef __cplusplus
}  // extern "C"
#endif
