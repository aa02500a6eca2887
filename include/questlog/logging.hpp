#pragma once

#include "types.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace questlog
{
    inline constexpr const char *kLoggerName = "questlog";

    /** Parse an spdlog level name (trace, debug, info, warn, error, critical, off) */
    Result<spdlog::level::level_enum> parse_log_level(const std::string &name);

    /**
     * Install a stderr logger named "questlog" as the spdlog default logger.
     * Safe to call more than once; later calls replace the level.
     */
    Result<void> configure_logging(const LoggingConfig &cfg);

    /** The questlog logger, falling back to the spdlog default logger. */
    std::shared_ptr<spdlog::logger> logger();

} // namespace questlog
