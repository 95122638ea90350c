#include <stdint.h>

#include "tally/errors.hpp"
#include "tally/program_api.h"

/* Duplicate entries share the borrow state of the account they duplicate. */
static TallyAccountInfo *borrow_root(TallyAccountInfo *acc)
{
  return acc->dup_of ? acc->dup_of : acc;
}

extern "C" tally_err tally_account_borrow_data(TallyAccountInfo *acc,
                                               const tally_u8 **out_data,
                                               tally_u64 *out_len)
{
  if (!acc || !out_data || !out_len)
    return TALLY_ERR(InvalidArg);

  TallyAccountInfo *root = borrow_root(acc);
  if (root->borrow_state < 0 || root->borrow_state == INT32_MAX)
    return TALLY_ERR(AccountBorrowFailed);

  ++root->borrow_state;
  *out_data = acc->data;
  *out_len = acc->data_len;
  return TALLY_ERR(OK);
}

extern "C" tally_err tally_account_borrow_data_mut(TallyAccountInfo *acc,
                                                   tally_u8 **out_data,
                                                   tally_u64 *out_len)
{
  if (!acc || !out_data || !out_len)
    return TALLY_ERR(InvalidArg);

  TallyAccountInfo *root = borrow_root(acc);
  if (root->borrow_state != 0)
    return TALLY_ERR(AccountBorrowFailed);

  root->borrow_state = -1;
  *out_data = acc->data;
  *out_len = acc->data_len;
  return TALLY_ERR(OK);
}

extern "C" tally_err tally_account_release_data(TallyAccountInfo *acc)
{
  if (!acc)
    return TALLY_ERR(InvalidArg);

  TallyAccountInfo *root = borrow_root(acc);
  if (root->borrow_state <= 0)
    return TALLY_ERR(InvalidArg);  // not borrowed shared

  --root->borrow_state;
  return TALLY_ERR(OK);
}

extern "C" tally_err tally_account_release_data_mut(TallyAccountInfo *acc)
{
  if (!acc)
    return TALLY_ERR(InvalidArg);

  TallyAccountInfo *root = borrow_root(acc);
  if (root->borrow_state != -1)
    return TALLY_ERR(InvalidArg);  // not borrowed exclusively

  root->borrow_state = 0;
  return TALLY_ERR(OK);
}

extern "C" tally_err tally_next_account(TallyAccountInfo *accounts, tally_u64 count,
                                        tally_u64 *cursor, TallyAccountInfo **out)
{
  if (!cursor || !out)
    return TALLY_ERR(InvalidArg);
  if (!accounts || *cursor >= count)
    return TALLY_ERR(MissingAccount);

  *out = &accounts[(*cursor)++];
  return TALLY_ERR(OK);
}
