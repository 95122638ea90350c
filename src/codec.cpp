// src/codec.cpp: fixed-layout instruction and counter record encoding
#include "tally/internal/codec.hpp"

#include "tally/errors.hpp"
#include "tally/instructions.hpp"
#include "tally/program_api.h"

/* ---- instruction: tag (1) + amount (u32 LE) ---- */
extern "C" tally_err tally_instruction_decode(const tally_u8 *data, tally_u64 len,
                                              TallyInstruction *out)
{
  if (!out)
    return TALLY_ERR(InvalidArg);

  // Exact length: no truncation, no trailing bytes
  if (!data || len != TALLY_INSTRUCTION_SIZE)
    return TALLY_ERR(MalformedInstruction);
  if (!tally::is_known_tag(data[0]))
    return TALLY_ERR(MalformedInstruction);

  out->tag = data[0];
  out->amount = tally_ld_le32(data + 1);
  return TALLY_ERR(OK);
}

extern "C" tally_err tally_instruction_encode(const TallyInstruction *insn, tally_u8 *out,
                                              tally_u64 cap)
{
  if (!insn || !out)
    return TALLY_ERR(InvalidArg);
  if (cap < TALLY_INSTRUCTION_SIZE)
    return TALLY_ERR(BufferTooSmall);
  if (!tally::is_known_tag(insn->tag))
    return TALLY_ERR(InvalidArg);

  out[0] = insn->tag;
  tally_st_le32(out + 1, insn->amount);
  return TALLY_ERR(OK);
}

/* ---- counter record: count (u32 LE) ---- */
extern "C" tally_err tally_state_decode(const tally_u8 *data, tally_u64 len,
                                        TallyCounterState *out)
{
  if (!out)
    return TALLY_ERR(InvalidArg);
  if (!data || len != TALLY_STATE_SIZE)
    return TALLY_ERR(MalformedState);

  out->count = tally_ld_le32(data);
  return TALLY_ERR(OK);
}

extern "C" tally_err tally_state_encode(const TallyCounterState *state, tally_u8 *out,
                                        tally_u64 cap)
{
  if (!state || !out)
    return TALLY_ERR(InvalidArg);
  if (cap < TALLY_STATE_SIZE)
    return TALLY_ERR(BufferTooSmall);

  tally_st_le32(out, state->count);
  return TALLY_ERR(OK);
}
