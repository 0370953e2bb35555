#pragma once

#include "export.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace svcdi {

/// Route library diagnostics to `logger`.  Passing nullptr restores the
/// default (spdlog's default logger).
SVCDI_EXPORT void set_logger(std::shared_ptr<spdlog::logger> logger);

/// The logger currently used by the library.
SVCDI_EXPORT std::shared_ptr<spdlog::logger> get_logger();

} // namespace svcdi
