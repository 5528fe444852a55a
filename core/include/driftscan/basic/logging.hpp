// driftscan/basic/logging.hpp - Default logger setup
//
// Library code logs through spdlog's default logger and never installs sinks
// itself. Front ends call init_logging() once at startup.
//
#pragma once

#include <spdlog/common.h>

namespace driftscan
{

/// Configure the default logger: stderr sink, level and the shared pattern.
void init_logging(spdlog::level::level_enum level, bool use_color);

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "off"; unknown -> info.
[[nodiscard]] spdlog::level::level_enum parse_log_level(const char * name);

}  // namespace driftscan
