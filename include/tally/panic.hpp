/**
 * @file panic.hpp
 * @brief tally panic handler C++ wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "tally/panic.h"

namespace tally
{

/**
 * @brief C++ wrapper for TallyPanicInfo
 */
using PanicInfo = TallyPanicInfo;

/**
 * @brief C++ wrapper for TallyPanicHandler
 */
using PanicHandler = TallyPanicHandler;

/**
 * @brief Set panic handler (C++ wrapper)
 *
 * @param handler    Panic handler callback
 * @param user_data  User data passed to handler
 */
inline void set_panic_handler(PanicHandler handler, void *user_data = nullptr)
{
  tally_set_panic_handler(handler, user_data);
}

}  // namespace tally
