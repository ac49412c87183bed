#pragma once

#include <spdlog/spdlog.h>

#include <string>

/// Parse a level name ("debug", "warn", ...). Unknown names give warn.
spdlog::level::level_enum parse_log_level(const std::string& name);

/// Install a stderr logger named "procctl" as the spdlog default.
/// PROCCTL_LOG_LEVEL, when set, overrides `level`.
void init_logging(const std::string& level);
