#pragma once

#include <spdlog/spdlog.h>
#include <optional>
#include <string>
#include <string_view>

namespace veil::common {

/// Install the process-wide async logger with console and file sinks.
///
/// An empty `log_file` keeps the console sink only.
void configure_logging(spdlog::level::level_enum level,
                       const std::string& log_file);

/// Parse an spdlog level name ("trace", "debug", "info", ...).
std::optional<spdlog::level::level_enum> try_parse_log_level(
    std::string_view name);

}  // namespace veil::common
