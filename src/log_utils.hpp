#pragma once

// Internal logging helpers.  Not installed.

#include "svcdi/logging.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace svcdi::internal {

/// Log through the library logger.  Formatting only happens when the level
/// is enabled; guard expensive arguments (demangled names) with should_log().
template <typename... Args>
void log(spdlog::level::level_enum level,
         spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, fmt, std::forward<Args>(args)...);
    }
}

inline bool should_log(spdlog::level::level_enum level) {
    auto logger = get_logger();
    return logger && logger->should_log(level);
}

} // namespace svcdi::internal
