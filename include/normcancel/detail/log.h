//
// Created on 2024/11/2.
//

#ifndef NORMCANCEL_LOG_H
#define NORMCANCEL_LOG_H

#include <spdlog/logger.h>

#include <memory>

namespace normcancel::detail {

/// The library's logger.
///
/// Reuses a logger already registered under NORMCANCEL_LOGGER_NAME,
/// otherwise creates a stderr color logger with the level taken from the
/// NORMCANCEL_LOG_LEVEL environment variable, or NORMCANCEL_DEFAULT_LOG_LEVEL.
auto logger() -> const std::shared_ptr<spdlog::logger>&;

}

#endif //NORMCANCEL_LOG_H
