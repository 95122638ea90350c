#pragma once
#include <stdint.h>

#include "tally/program_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Failed invocation diagnostic information
   *
   * Collected by tally_panic() and passed to the registered handler.
   */
  typedef struct TallyPanicInfo
  {
    int32_t error_code;        /**< Error code (Err enumeration value) */
    uint64_t exit_code;        /**< Code returned to the host */
    uint64_t account_count;    /**< Accounts passed to the invocation */
    uint64_t instruction_len;  /**< Instruction length in bytes */
    bool has_input;            /**< Whether the input was decoded */
  } TallyPanicInfo;

  /**
   * @brief Panic handler callback type
   *
   * Called when an invocation fails.
   *
   * @param user_data  User data pointer passed to tally_set_panic_handler
   * @param info       Panic diagnostic information
   */
  typedef void (*TallyPanicHandler)(void *user_data, const TallyPanicInfo *info);

  /**
   * @brief Set custom panic handler
   *
   * Registers a callback to be invoked when tally_panic() is called.
   * This allows embedders to implement custom error handling/logging.
   *
   * @param handler    Panic handler callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void tally_set_panic_handler(TallyPanicHandler handler, void *user_data);

  /**
   * @brief Report a failed invocation
   *
   * Writes one "Program failed" line to the host log and calls the
   * registered handler.
   *
   * @param input       Decoded input (NULL if decoding failed)
   * @param error_code  Error that aborted the invocation
   * @return error_code, unchanged
   */
  tally_err tally_panic(const TallyInput *input, tally_err error_code);

#ifdef __cplusplus
}
#endif
