#include "core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>

namespace {
constexpr const char* kLoggerName = "procctl";
constexpr const char* kPattern = "%^[%Y-%m-%d %H:%M:%S.%e] [%l]%$ %v";
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "off") return spdlog::level::off;
    // from_str() maps unrecognised names to off
    auto level = spdlog::level::from_str(name);
    return level == spdlog::level::off ? spdlog::level::warn : level;
}

void init_logging(const std::string& level) {
    std::string effective = level;
    if (const char* env = std::getenv("PROCCTL_LOG_LEVEL")) {
        if (*env) effective = env;
    }

    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern(kPattern);
        spdlog::set_default_logger(logger);
    }
    spdlog::set_level(parse_log_level(effective));
}
