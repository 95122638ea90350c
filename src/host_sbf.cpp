/**
 * @file host_sbf.cpp
 * @brief Bridge between tally's host interface and the SBF runtime
 *
 * Only built for the SBF target (TALLY_TARGET_SBF).
 */

#include "sbf/syscalls.h"
#include "tally/host.h"
#include "tally/program_api.h"

extern "C" void tally_host_log(const char *msg, uint64_t len)
{
  sol_log_(msg, len);
}

/* Symbol the loader calls for every invocation */
extern "C" uint64_t entrypoint(const uint8_t *input)
{
  // The input region is mapped writable; account data is mutated in place.
  return tally_entrypoint(const_cast<tally_u8 *>(input), SBF_INPUT_LEN_UNBOUNDED);
}
