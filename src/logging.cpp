#include "questlog/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <format>

namespace questlog
{

    Result<spdlog::level::level_enum> parse_log_level(const std::string &name)
    {
        auto level = spdlog::level::from_str(name);
        // from_str maps unknown names to off
        if (level == spdlog::level::off && name != "off")
        {
            return std::unexpected(QuestError::config(std::format("Invalid log level: {}", name)));
        }
        return level;
    }

    Result<void> configure_logging(const LoggingConfig &cfg)
    {
        auto level = parse_log_level(cfg.level);
        if (!level)
            return std::unexpected(level.error());

        auto log = spdlog::get(kLoggerName);
        if (!log)
        {
            log = spdlog::stderr_color_st(kLoggerName);
            log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        }
        log->set_level(*level);
        spdlog::set_default_logger(log);
        return {};
    }

    std::shared_ptr<spdlog::logger> logger()
    {
        if (auto log = spdlog::get(kLoggerName))
            return log;
        return spdlog::default_logger();
    }

} // namespace questlog
