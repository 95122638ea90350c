// src/entrypoint.cpp: loader input decoding and invocation driver
#include <stdint.h>

#include "tally/errors.hpp"
#include "tally/internal/codec.hpp"
#include "tally/panic.h"
#include "tally/program_api.h"

namespace
{

/* Bounds-checked cursor over the input buffer. Alignment is relative to the
 * start of the buffer, which is checked to be 8-byte aligned. */
struct Reader
{
  tally_u8 *base;
  tally_u64 pos;
  tally_u64 len;

  bool take(tally_u64 n, tally_u8 **out)
  {
    if (n > len - pos)
      return false;
    *out = base + pos;
    pos += n;
    return true;
  }

  bool skip(tally_u64 n)
  {
    tally_u8 *unused;
    return take(n, &unused);
  }

  bool u8(tally_u8 *out)
  {
    tally_u8 *p;
    if (!take(1, &p))
      return false;
    *out = *p;
    return true;
  }

  bool u64(tally_u64 *out)
  {
    tally_u8 *p;
    if (!take(8, &p))
      return false;
    *out = tally_ld_le64(p);
    return true;
  }

  bool align8()
  {
    const tally_u64 pad = (8 - (pos & 7u)) & 7u;
    return skip(pad);
  }
};

/* Fields following a unique account's dup_info byte. */
bool read_account(Reader *r, TallyAccountInfo *acc)
{
  tally_u8 signer, writable, executable;
  if (!r->u8(&signer) || !r->u8(&writable) || !r->u8(&executable))
    return false;
  if (!r->skip(4))  // original_data_len
    return false;

  tally_u8 *key, *owner, *lamports;
  if (!r->take(TALLY_PUBKEY_SIZE, &key) || !r->take(TALLY_PUBKEY_SIZE, &owner))
    return false;
  if (!r->take(8, &lamports))
    return false;

  tally_u64 data_len;
  tally_u8 *data;
  if (!r->u64(&data_len) || !r->take(data_len, &data))
    return false;
  if (!r->skip(TALLY_MAX_PERMITTED_DATA_INCREASE) || !r->align8())
    return false;

  tally_u64 rent_epoch;
  if (!r->u64(&rent_epoch))
    return false;

  acc->key = reinterpret_cast<const TallyPubkey *>(key);
  acc->owner = reinterpret_cast<const TallyPubkey *>(owner);
  acc->lamports = reinterpret_cast<tally_u64 *>(lamports);
  acc->data = data;
  acc->data_len = data_len;
  acc->rent_epoch = rent_epoch;
  acc->is_signer = signer != 0;
  acc->is_writable = writable != 0;
  acc->executable = executable != 0;
  acc->borrow_state = 0;
  acc->dup_of = nullptr;
  return true;
}

}  // namespace

extern "C" tally_err tally_deserialize_input(tally_u8 *buf, tally_u64 len, TallyInput *out)
{
  if (!buf || !out)
    return TALLY_ERR(InvalidArg);

  *out = TallyInput{};

  // Field offsets are 8-aligned relative to buf
  if (reinterpret_cast<uintptr_t>(buf) & 7u)
    return TALLY_ERR(MalformedInput);

  Reader r{buf, 0, len};

  tally_u64 count;
  if (!r.u64(&count))
    return TALLY_ERR(MalformedInput);
  if (count > TALLY_MAX_ACCOUNTS)
    return TALLY_ERR(MalformedInput);

  for (tally_u64 i = 0; i < count; ++i)
  {
    tally_u8 dup_info;
    if (!r.u8(&dup_info))
      return TALLY_ERR(MalformedInput);

    TallyAccountInfo *acc = &out->accounts[i];
    if (dup_info == TALLY_NON_DUP_MARKER)
    {
      if (!read_account(&r, acc))
        return TALLY_ERR(MalformedInput);
      continue;
    }

    // Duplicate of an earlier entry
    if (dup_info >= i)
      return TALLY_ERR(MalformedInput);
    if (!r.skip(7))
      return TALLY_ERR(MalformedInput);

    TallyAccountInfo *orig = &out->accounts[dup_info];
    *acc = *orig;
    acc->dup_of = orig->dup_of ? orig->dup_of : orig;
  }
  out->account_count = count;

  tally_u64 data_len;
  tally_u8 *data;
  if (!r.u64(&data_len) || !r.take(data_len, &data))
    return TALLY_ERR(MalformedInput);
  out->data = data;
  out->data_len = data_len;

  tally_u8 *program_id;
  if (!r.take(TALLY_PUBKEY_SIZE, &program_id))
    return TALLY_ERR(MalformedInput);
  out->program_id = reinterpret_cast<const TallyPubkey *>(program_id);

  return TALLY_ERR(OK);
}

extern "C" tally_u64 tally_entrypoint(tally_u8 *buf, tally_u64 len)
{
  TallyInput input;
  tally_err e = tally_deserialize_input(buf, len, &input);
  if (e)
    return tally_err_exit_code(tally_panic(nullptr, e));

  e = tally_process_instruction(input.program_id, input.accounts, input.account_count,
                                input.data, input.data_len);
  if (e)
    return tally_err_exit_code(tally_panic(&input, e));

  return 0;
}
