#pragma once

// Error code definition using the same pattern as instructions.def
// Define ERR(name, val, exit_index, msg) before including this file if you want to
// extract text or mapping.

#include <cstdint>

#ifndef ERR
#define ERR(name, val, exit_index, msg) name = val,
#endif

namespace tally
{

enum class Err : int
{
#include "tally/errors.def"
};

#undef ERR

// Optional: helper to get a string message for each error
inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, exit_index, msg) \
  case Err::name:                       \
    return msg;
#include "tally/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

// Builtin program error index reported to the host
inline std::uint32_t err_exit_index(Err e)
{
  switch (e)
  {
#define ERR(name, val, exit_index, msg) \
  case Err::name:                       \
    return exit_index;
#include "tally/errors.def"
#undef ERR
    default:
      return 2;  // InvalidArgument
  }
}

}  // namespace tally

// Macro to reduce code size for error returns
#define TALLY_ERR(name) static_cast<int>(::tally::Err::name)
