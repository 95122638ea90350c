/**
 * @file program_api.hpp
 * @brief tally C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "tally/errors.hpp"
#include "tally/program_api.h"

namespace tally
{

using AccountInfo = TallyAccountInfo;
using Instruction = TallyInstruction;
using CounterState = TallyCounterState;

/**
 * @brief Shared borrow of an account's data, released on scope exit.
 *
 * Check err() before touching data(); a failed borrow holds nothing.
 */
class DataRef
{
public:
  explicit DataRef(AccountInfo *acc) : acc_(acc)
  {
    err_ = tally_account_borrow_data(acc_, &data_, &len_);
  }
  ~DataRef()
  {
    if (err_ == 0)
      (void)tally_account_release_data(acc_);
  }
  DataRef(const DataRef &) = delete;
  DataRef &operator=(const DataRef &) = delete;

  tally_err err() const { return err_; }
  const tally_u8 *data() const { return data_; }
  tally_u64 size() const { return len_; }

private:
  AccountInfo *acc_;
  const tally_u8 *data_ = nullptr;
  tally_u64 len_ = 0;
  tally_err err_;
};

/**
 * @brief Exclusive borrow of an account's data, released on scope exit.
 */
class DataRefMut
{
public:
  explicit DataRefMut(AccountInfo *acc) : acc_(acc)
  {
    err_ = tally_account_borrow_data_mut(acc_, &data_, &len_);
  }
  ~DataRefMut()
  {
    if (err_ == 0)
      (void)tally_account_release_data_mut(acc_);
  }
  DataRefMut(const DataRefMut &) = delete;
  DataRefMut &operator=(const DataRefMut &) = delete;

  tally_err err() const { return err_; }
  tally_u8 *data() const { return data_; }
  tally_u64 size() const { return len_; }

private:
  AccountInfo *acc_;
  tally_u8 *data_ = nullptr;
  tally_u64 len_ = 0;
  tally_err err_;
};

}  // namespace tally
