//
// Created on 2024/11/2.
//

#include "../../include/normcancel/detail/log.h"
#include "../../include/normcancel/config.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace {

auto configured_level() -> spdlog::level::level_enum {
    const char* name = std::getenv(NORMCANCEL_LOG_LEVEL_ENV);
    if (name == nullptr || *name == '\0') {
        name = NORMCANCEL_DEFAULT_LOG_LEVEL;
    }
    // from_str() maps unknown names to off.
    return spdlog::level::from_str(name);
}

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get(NORMCANCEL_LOGGER_NAME)) {
        return existing;
    }

    std::shared_ptr<spdlog::logger> created;
    try {
        created = spdlog::stderr_color_mt(NORMCANCEL_LOGGER_NAME);
    }
    catch (const spdlog::spdlog_ex&) {
        // Lost a registration race with another thread.
        created = spdlog::get(NORMCANCEL_LOGGER_NAME);
    }
    created->set_level(configured_level());
    return created;
}

}

auto normcancel::detail::logger() -> const std::shared_ptr<spdlog::logger>& {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}
