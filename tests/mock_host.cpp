#include <cstring>

#include "mock_host.h"
#include "tally/host.h"

/**
 * @file mock_host.cpp
 * @brief Mock host implementation for unit testing
 *
 * Records program log lines instead of forwarding them to a runtime.
 */

/* ------------------------------------------------------------------------- */
/* Mock state tracking                                                       */
/* ------------------------------------------------------------------------- */

#define MAX_LOG_LINES 32
#define LOG_LINE_SIZE 256

struct MockLogState
{
  char lines[MAX_LOG_LINES][LOG_LINE_SIZE];
  int count;
};

static struct MockLogState mock_log;

/* ------------------------------------------------------------------------- */
/* Mock control functions (for tests)                                       */
/* ------------------------------------------------------------------------- */

extern "C" void mock_host_reset(void)
{
  memset(&mock_log, 0, sizeof(mock_log));
}

extern "C" int mock_host_log_count(void)
{
  return mock_log.count;
}

extern "C" const char *mock_host_log_line(int i)
{
  if (i < 0 || i >= mock_log.count)
    return "";
  return mock_log.lines[i];
}

/* ------------------------------------------------------------------------- */
/* Host syscalls                                                             */
/* ------------------------------------------------------------------------- */

extern "C" void tally_host_log(const char *msg, uint64_t len)
{
  if (mock_log.count >= MAX_LOG_LINES)
    return;

  char *dst = mock_log.lines[mock_log.count++];
  size_t n = (len < LOG_LINE_SIZE - 1) ? (size_t)len : LOG_LINE_SIZE - 1;
  memcpy(dst, msg, n);
  dst[n] = '\0';
}
