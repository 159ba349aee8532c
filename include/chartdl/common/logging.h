#pragma once

#include <spdlog/common.h>

#include <optional>
#include <string_view>

namespace chartdl::logging {

/// trace|debug|info|warn|warning|error|err|critical|off, case-insensitive.
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name);

/**
 * Route the default logger to stderr with the chartdl pattern and apply the level.
 * CHARTDL_LOG_LEVEL wins over the argument; an unknown name falls back to info.
 */
void initLogging(std::string_view level);

} // namespace chartdl::logging
