#include <cinttypes>
#include <cstdint>

#include "tally/errors.hpp"
#include "tally/instructions.hpp"
#include "tally/internal/log.hpp"
#include "tally/program_api.h"
#include "tally/program_api.hpp"

namespace
{

// Unchecked: wraps modulo 2^32 in both directions.
void apply(const tally::Instruction &insn, tally::CounterState *state)
{
  using tally::Tag;

  switch (static_cast<Tag>(insn.tag))
  {
    case Tag::Increment:
      state->count += insn.amount;
      break;

    case Tag::Decrement:
      state->count -= insn.amount;
      break;
  }
}

}  // namespace

extern "C" tally_err tally_process_instruction(const TallyPubkey *program_id,
                                               TallyAccountInfo *accounts, tally_u64 count,
                                               const tally_u8 *data, tally_u64 data_len)
{
  using namespace tally;
  (void)program_id;

  tally_u64 cursor = 0;
  AccountInfo *acc = nullptr;
  if (tally_err e = tally_next_account(accounts, count, &cursor, &acc))
    return e;

  Instruction insn{};
  if (tally_err e = tally_instruction_decode(data, data_len, &insn))
    return e;

  // 1) Read the record
  CounterState state{};
  {
    DataRef ref(acc);
    if (ref.err())
      return ref.err();
    if (tally_err e = tally_state_decode(ref.data(), ref.size(), &state))
      return e;
  }

  // 2) Mutate
  apply(insn, &state);

  // 3) Write back in place (decode guaranteed the slot is exactly 4 bytes)
  {
    DataRefMut ref(acc);
    if (ref.err())
      return ref.err();
    if (tally_err e = tally_state_encode(&state, ref.data(), ref.size()))
      return e;
  }

  log_line("Counter updated to %" PRIu32, state.count);
  return TALLY_ERR(OK);
}
