#include "questlog/config.hpp"
#include "questlog/logging.hpp"
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace questlog
{
    namespace
    {
        constexpr int64_t kMaxIndent = 16;

        Result<int> checked_indent(int64_t value)
        {
            if (value < 0 || value > kMaxIndent)
            {
                return std::unexpected(QuestError::config(
                    std::format("storage.indent must be between 0 and {}, got {}", kMaxIndent, value)));
            }
            return static_cast<int>(value);
        }

        Result<int> parse_indent(const std::string &text)
        {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::unexpected(QuestError::config("Invalid indent: " + text));
            }
            return checked_indent(value);
        }

        Result<QuestlogConfig> parse_toml(const toml::table &tbl, QuestlogConfig cfg)
        {
            if (auto storage = tbl["storage"].as_table())
            {
                if (auto path = (*storage)["path"].value<std::string>())
                    cfg.storage.path = *path;
                if (auto indent = (*storage)["indent"].value<int64_t>())
                {
                    auto checked = checked_indent(*indent);
                    if (!checked)
                        return std::unexpected(checked.error());
                    cfg.storage.indent = *checked;
                }
                if (auto labels = (*storage)["labels"].value<std::string>())
                {
                    auto parsed = labels_from_string(*labels);
                    if (!parsed)
                        return std::unexpected(parsed.error());
                    cfg.storage.labels = *parsed;
                }
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            return cfg;
        }

    } // namespace

    Result<QuestlogConfig> ConfigLoader::defaults()
    {
        QuestlogConfig cfg{};
        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        auto valid = validate(cfg);
        if (!valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<QuestlogConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(QuestError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<QuestlogConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        QuestlogConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = *parsed;
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(QuestError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        auto valid = validate(cfg);
        if (!valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(QuestlogConfig &cfg)
    {
        if (const char *path = std::getenv("QUESTLOG_FILE"))
            cfg.storage.path = path;
        if (const char *indent = std::getenv("QUESTLOG_INDENT"))
        {
            auto parsed = parse_indent(indent);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.storage.indent = *parsed;
        }
        if (const char *labels = std::getenv("QUESTLOG_LABELS"))
        {
            auto parsed = labels_from_string(labels);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.storage.labels = *parsed;
        }
        if (const char *level = std::getenv("QUESTLOG_LOG_LEVEL"))
            cfg.logging.level = level;
        return {};
    }

    Result<void> ConfigLoader::validate(const QuestlogConfig &cfg)
    {
        if (cfg.storage.path.empty())
            return std::unexpected(QuestError::config("storage.path must not be empty"));
        auto indent = checked_indent(cfg.storage.indent);
        if (!indent)
            return std::unexpected(indent.error());
        auto level = parse_log_level(cfg.logging.level);
        if (!level)
            return std::unexpected(level.error());
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const QuestlogConfig &cfg)
    {
        nlohmann::json j;
        j["storage"] = {
            {"path", cfg.storage.path},
            {"indent", cfg.storage.indent},
            {"labels", labels_to_string(cfg.storage.labels)}};
        j["logging"] = {{"level", cfg.logging.level}};
        return j;
    }

} // namespace questlog
