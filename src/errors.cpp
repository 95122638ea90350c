#include "tally/errors.h"

#include "tally/errors.hpp"

extern "C" const char *tally_err_message(int err)
{
  return tally::err_str(static_cast<tally::Err>(err));
}

extern "C" uint64_t tally_err_exit_code(int err)
{
  if (err == 0)
    return 0;
  return static_cast<uint64_t>(tally::err_exit_index(static_cast<tally::Err>(err))) << 32;
}
