#pragma once
#include <cstdint>

namespace tally
{

/** Instruction discriminant (single byte). The amount follows little-endian. */
enum class Tag : std::uint8_t
{
#define INSN(name, val) name = val,
#include "tally/instructions.def"
#undef INSN
};

// -----------------------------------------------------------------------------
// Instruction entry definition
// -----------------------------------------------------------------------------
struct InstructionEntry
{
  std::uint8_t discriminant;
};

// -----------------------------------------------------------------------------
// Instruction table (generated from instructions.def)
// -----------------------------------------------------------------------------
static constexpr InstructionEntry kInstructionTable[] = {
#define INSN(name, val) {val},
#include "tally/instructions.def"
#undef INSN
};

inline bool is_known_tag(std::uint8_t b)
{
  for (const InstructionEntry& e : kInstructionTable)
  {
    if (e.discriminant == b)
      return true;
  }
  return false;
}

}  // namespace tally
