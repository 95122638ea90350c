#pragma once

/**
 * @file config.h
 * @brief Compile-time configuration
 *
 * Every value can be overridden with -D on the compiler command line.
 */

/** Maximum number of account entries decoded from the entrypoint input. */
#ifndef TALLY_MAX_ACCOUNTS
#define TALLY_MAX_ACCOUNTS 8
#endif

/** Realloc headroom the loader reserves after each account's data. */
#ifndef TALLY_MAX_PERMITTED_DATA_INCREASE
#define TALLY_MAX_PERMITTED_DATA_INCREASE (1024 * 10)
#endif

/** Set to 0 to compile out every call into the host log. */
#ifndef TALLY_LOG_ENABLED
#define TALLY_LOG_ENABLED 1
#endif

/** Size of the stack buffer a single log line is formatted into. */
#ifndef TALLY_LOG_LINE_MAX
#define TALLY_LOG_LINE_MAX 128
#endif
