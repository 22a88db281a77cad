#pragma once

// Internal logging helper.  Not installed.

#include <spdlog/spdlog.h>

#include <memory>

namespace svcreg::internal {

/// The "svcreg" logger.  Created on first use with the default logger's
/// sinks and the global level, so applications configure it through spdlog
/// like any other logger.
std::shared_ptr<spdlog::logger> logger();

} // namespace svcreg::internal
