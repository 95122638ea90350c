#pragma once
#include <stdint.h>

/**
 * Little-endian load/store helpers shared by the record codec and the
 * entrypoint input decoder. Callers check bounds.
 */

static inline uint32_t tally_ld_le32(const uint8_t *p)
{
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
         ((uint32_t)p[3] << 24);
}
static inline void tally_st_le32(uint8_t *p, uint32_t v)
{
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
  p[2] = (uint8_t)((v >> 16) & 0xFF);
  p[3] = (uint8_t)((v >> 24) & 0xFF);
}
static inline uint64_t tally_ld_le64(const uint8_t *p)
{
  return (uint64_t)tally_ld_le32(p) | ((uint64_t)tally_ld_le32(p + 4) << 32);
}
static inline void tally_st_le64(uint8_t *p, uint64_t v)
{
  tally_st_le32(p, (uint32_t)(v & 0xFFFFFFFFu));
  tally_st_le32(p + 4, (uint32_t)(v >> 32));
}
