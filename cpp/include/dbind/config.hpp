#ifndef __DBIND_CONFIG_HPP
#define __DBIND_CONFIG_HPP

// Default configuration. Every option can be overridden on the compiler
// command line (e.g. -DDBIND_ENABLE_TEXT_LOGGING=0).

#ifndef DBIND_ENABLE_TEXT_LOGGING
#define DBIND_ENABLE_TEXT_LOGGING 1
#endif

#ifndef DBIND_ENABLE_EVENT_LOOP
#define DBIND_ENABLE_EVENT_LOOP 1
#endif

#ifndef DBIND_MAX_LOG_VERBOSITY
#define DBIND_MAX_LOG_VERBOSITY 5
#endif

// Maximum number of (message, file, line) frames a RichStatus carries.
#ifndef DBIND_MAX_STATUS_FRAMES
#define DBIND_MAX_STATUS_FRAMES 4
#endif

// Timeout for remote method calls in milliseconds. -1 selects the libdbus
// default (25 seconds).
#ifndef DBIND_DEFAULT_CALL_TIMEOUT_MS
#define DBIND_DEFAULT_CALL_TIMEOUT_MS -1
#endif

#endif // __DBIND_CONFIG_HPP
