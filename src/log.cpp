#include "tally/internal/log.hpp"

#include <cstdarg>
#include <cstddef>
#include <cstdio>

#include "tally/host.h"

namespace tally
{

void log_line(const char *fmt, ...)
{
#if TALLY_LOG_ENABLED
  char line[TALLY_LOG_LINE_MAX];

  va_list ap;
  va_start(ap, fmt);
  const int n = std::vsnprintf(line, sizeof(line), fmt, ap);
  va_end(ap);
  if (n < 0)
    return;

  // vsnprintf reports the untruncated length
  std::size_t len = static_cast<std::size_t>(n);
  if (len >= sizeof(line))
    len = sizeof(line) - 1;
  tally_host_log(line, len);
#else
  (void)fmt;
#endif
}

}  // namespace tally
