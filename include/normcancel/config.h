//
// Created on 2024/11/2.
//

#ifndef NORMCANCEL_CONFIG_H
#define NORMCANCEL_CONFIG_H

#define NORMCANCEL_VERSION_MAJOR 0
#define NORMCANCEL_VERSION_MINOR 1
#define NORMCANCEL_VERSION_PATCH 0
#define NORMCANCEL_VERSION_STRING "0.1.0"

/// Name of the spdlog logger the library writes to. An application can
/// register its own logger under this name before first use to redirect
/// library output.
#ifndef NORMCANCEL_LOGGER_NAME
#define NORMCANCEL_LOGGER_NAME "normcancel"
#endif

/// Level used when NORMCANCEL_LOG_LEVEL is not set in the environment.
/// One of spdlog's level names: trace, debug, info, warning, error, critical, off.
#ifndef NORMCANCEL_DEFAULT_LOG_LEVEL
#define NORMCANCEL_DEFAULT_LOG_LEVEL "warning"
#endif

/// Environment variable read once when the logger is created.
#ifndef NORMCANCEL_LOG_LEVEL_ENV
#define NORMCANCEL_LOG_LEVEL_ENV "NORMCANCEL_LOG_LEVEL"
#endif

/// Initial node capacity of the lock-free queue feeding the timer thread.
/// The queue grows past this on demand.
#ifndef NORMCANCEL_TIMER_QUEUE_CAPACITY
#define NORMCANCEL_TIMER_QUEUE_CAPACITY 128
#endif

#endif //NORMCANCEL_CONFIG_H
