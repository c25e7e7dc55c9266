#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace svg_logging {

// Shared logger for all svg_composer libraries. Created on first use with a
// colored stderr sink at the global level.
std::shared_ptr<spdlog::logger> logger();

// Rebuilds the logger sinks: stderr at console_level and, if use_file_handler,
// a rotating file logs/<cwd-name>.log at file_level. Unset levels fall back to
// the global level.
void configure_logging(std::optional<spdlog::level::level_enum> console_level = std::nullopt,
    std::optional<spdlog::level::level_enum> file_level = std::nullopt,
    bool use_file_handler = false);

// Sets the global level and reconfigures every sink with it.
void set_global_logging_level(spdlog::level::level_enum level, bool use_file_handler = false);
spdlog::level::level_enum global_logging_level();

// "trace", "debug", "info", "warn", "error", "critical", "off" (case-sensitive).
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

} // namespace svg_logging
