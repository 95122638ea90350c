#include "tally/panic.h"

#include "tally/errors.hpp"
#include "tally/internal/log.hpp"
#include "tally/panic.hpp"
#include "tally/program_api.h"

// Registered handler (process-wide; one invocation runs at a time)
static TallyPanicHandler g_panic_handler = nullptr;
static void *g_panic_user_data = nullptr;

extern "C"
{
  void tally_set_panic_handler(TallyPanicHandler handler, void *user_data)
  {
    g_panic_handler = handler;
    g_panic_user_data = user_data;
  }

  tally_err tally_panic(const TallyInput *input, tally_err error_code)
  {
    using namespace tally;

    // Collect panic information
    TallyPanicInfo info{};
    info.error_code = error_code;
    info.exit_code = tally_err_exit_code(error_code);
    info.has_input = (input != nullptr);
    if (input)
    {
      info.account_count = input->account_count;
      info.instruction_len = input->data_len;
    }

    Err err = static_cast<Err>(error_code);
    log_line("Program failed: %s (code=%d)", err_str(err), error_code);

    // Call custom panic handler if registered
    if (g_panic_handler)
    {
      g_panic_handler(g_panic_user_data, &info);
    }

    return error_code;
  }

}  // extern "C"
