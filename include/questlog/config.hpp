#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace questlog
{

    struct StorageConfig
    {
        std::string path{"quests.json"};
        int indent{4};
        PriorityLabels labels{PriorityLabels::Reference};
    };

    struct LoggingConfig
    {
        std::string level{"warn"};
    };

    struct QuestlogConfig
    {
        StorageConfig storage{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides.
     * Precedence, lowest first: built-in defaults, TOML file, environment.
     * Command-line flags are applied on top by the CLI.
     */
    class ConfigLoader
    {
    public:
        /** Built-in defaults with environment overrides applied. */
        static Result<QuestlogConfig> defaults();

        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<QuestlogConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<QuestlogConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for debugging/inspection. */
        static nlohmann::json to_json(const QuestlogConfig &cfg);

    private:
        static Result<void> apply_env_overrides(QuestlogConfig &cfg);
        static Result<void> validate(const QuestlogConfig &cfg);
    };

} // namespace questlog
