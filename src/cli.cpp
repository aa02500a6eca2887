#include "questlog/cli.hpp"
#include "questlog/config.hpp"
#include "questlog/logging.hpp"
#include "questlog/quest_store.hpp"
#include <CLI/CLI.hpp>
#include <format>
#include <iostream>
#include <optional>

namespace questlog::cli
{
    namespace
    {
        std::optional<std::string> optional_value(const CLI::Option *opt, const std::string &value)
        {
            if (opt->count() == 0)
                return std::nullopt;
            return value;
        }

        int report(const QuestError &error, std::ostream &err)
        {
            err << "Error: " << error.what() << std::endl;
            return exit_code_for(error);
        }

        int usage(const CLI::App &app, const std::string &message, std::ostream &err)
        {
            err << "Error: " << message << "\n\n"
                << app.help() << std::endl;
            return kUsage;
        }
    } // namespace

    int exit_code_for(const QuestError &error)
    {
        switch (error.code)
        {
        case ErrorCode::InvalidInput:
        case ErrorCode::DuplicateName:
        case ErrorCode::NotFound:
            return kRejected;
        case ErrorCode::CorruptData:
        case ErrorCode::IOError:
        case ErrorCode::ConfigError:
            return kFailure;
        }
        return kFailure;
    }

    std::string render_quest(const Quest &quest, PriorityLabels labels)
    {
        return std::format("Quest: {} - {} ({}, Priority: {})",
                           quest.name,
                           quest.description,
                           quest.done ? "Done" : "Pending",
                           priority_to_string(quest.priority, labels));
    }

    int run(int argc, const char *const *argv, std::ostream &out, std::ostream &err)
    {
        CLI::App app{"questlog - command-line quest tracker", "questlog"};

        std::string action;
        app.add_option("action", action, "Action to perform")
            ->required()
            ->check(CLI::IsMember({"add", "list", "complete", "remove"}));

        std::string name;
        std::string description;
        std::string priority;
        std::string filter_status;
        std::string filter_priority;
        std::string file_path;
        std::string config_path;
        bool by_priority{false};
        bool verbose{false};

        app.add_option("--name", name, "Quest name");
        app.add_option("--description", description, "Quest description");
        auto priority_opt = app.add_option("--priority", priority,
                                           "Quest priority: alta, média, baixa (high, medium, low); default média");
        auto status_opt = app.add_option("--filter-status", filter_status, "List only pending or done quests");
        auto filter_priority_opt = app.add_option("--filter-priority", filter_priority,
                                                  "List only quests with this priority");
        app.add_flag("--by-priority", by_priority, "List quests ordered high, medium, low");
        app.add_option("--file", file_path, "Quest file (overrides config)");
        app.add_option("--config", config_path, "Path to config TOML");
        app.add_flag("-v,--verbose", verbose, "Debug logging on stderr");

        try
        {
            app.parse(argc, argv);
        }
        catch (const CLI::ParseError &e)
        {
            return app.exit(e, out, err);
        }

        if (action == "add" && (name.empty() || description.empty()))
            return usage(app, "action 'add' requires --name and --description", err);
        if ((action == "complete" || action == "remove") && name.empty())
            return usage(app, std::format("action '{}' requires --name", action), err);

        auto cfg = config_path.empty() ? ConfigLoader::defaults() : ConfigLoader::load(config_path);
        if (!cfg)
            return report(cfg.error(), err);
        if (!file_path.empty())
            cfg->storage.path = file_path;
        if (verbose)
            cfg->logging.level = "debug";

        auto logging = configure_logging(cfg->logging);
        if (!logging)
            return report(logging.error(), err);
        logger()->debug("Effective config: {}", ConfigLoader::to_json(*cfg).dump());

        auto store = QuestStore::open(cfg->storage);
        if (!store)
            return report(store.error(), err);

        const auto labels = cfg->storage.labels;

        if (action == "add")
        {
            auto added = priority_opt->count() > 0
                             ? store->add_quest(name, description, priority)
                             : store->add_quest(name, description);
            if (!added)
                return report(added.error(), err);
            out << std::format("Quest '{}' added.", name) << std::endl;
            return kSuccess;
        }

        if (action == "list")
        {
            auto quests = store->list_filtered(optional_value(status_opt, filter_status),
                                               optional_value(filter_priority_opt, filter_priority));
            if (!quests)
                return report(quests.error(), err);
            if (quests->empty())
            {
                out << "No quests found." << std::endl;
                return kSuccess;
            }
            if (by_priority)
                *quests = sort_by_priority(std::move(*quests));

            out << "Quests:" << std::endl;
            for (const auto &quest : *quests)
            {
                out << render_quest(quest, labels) << std::endl;
            }
            return kSuccess;
        }

        if (action == "complete")
        {
            auto completed = store->complete_quest(name);
            if (!completed)
                return report(completed.error(), err);
            out << std::format("Quest '{}' marked as done.", name) << std::endl;
            return kSuccess;
        }

        auto removed = store->remove_quest(name);
        if (!removed)
            return report(removed.error(), err);
        out << std::format("Quest '{}' removed.", name) << std::endl;
        return kSuccess;
    }

    int run(int argc, char *argv[])
    {
        return run(argc, argv, std::cout, std::cerr);
    }

} // namespace questlog::cli
