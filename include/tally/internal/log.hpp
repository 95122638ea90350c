#pragma once

#include "tally/config.h"

namespace tally
{

/**
 * Format one line into a TALLY_LOG_LINE_MAX stack buffer and hand it to
 * tally_host_log(). Longer lines are truncated. Compiled out when
 * TALLY_LOG_ENABLED is 0.
 */
void log_line(const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

}  // namespace tally
