#include "questlog/quest_store.hpp"
#include "questlog/logging.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace questlog
{
    namespace fs = std::filesystem;

    namespace
    {
        bool is_blank(const std::string &s)
        {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
        }

        bool is_valid_utf8(const std::string &s)
        {
            try
            {
                (void)nlohmann::json(s).dump();
                return true;
            }
            catch (const nlohmann::json::type_error &)
            {
                return false;
            }
        }

        Result<bool> status_to_done(const std::string &status)
        {
            if (status == "pending")
                return false;
            if (status == "done")
                return true;
            return std::unexpected(QuestError::invalid_input(
                std::format("Invalid status '{}': use 'pending' or 'done'", status)));
        }
    } // namespace

    QuestStore::QuestStore(StorageConfig cfg) : cfg_(std::move(cfg)) {}

    Result<QuestStore> QuestStore::open(const StorageConfig &cfg)
    {
        QuestStore store(cfg);
        auto loaded = store.load();
        if (!loaded)
            return std::unexpected(loaded.error());
        return store;
    }

    Result<void> QuestStore::load()
    {
        std::error_code ec;
        bool exists = fs::exists(cfg_.path, ec);
        if (ec)
        {
            return std::unexpected(QuestError::io(std::format(
                "Unable to check quest file {}: {}", cfg_.path, ec.message())));
        }
        if (!exists)
        {
            logger()->debug("No quest file at {}, starting empty", cfg_.path);
            quests_.clear();
            return {};
        }

        std::ifstream file(cfg_.path);
        if (fs::is_directory(cfg_.path, ec) || !file.is_open())
        {
            return std::unexpected(QuestError::io("Unable to open quest file: " + cfg_.path));
        }

        nlohmann::json doc;
        try
        {
            doc = nlohmann::json::parse(file);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            return std::unexpected(QuestError::corrupt_data(
                std::format("Quest file {} is not valid JSON: {}", cfg_.path, e.what())));
        }

        auto quests = quests_from_json(doc);
        if (!quests)
        {
            return std::unexpected(quests.error());
        }
        quests_ = std::move(*quests);
        logger()->debug("Loaded {} quests from {}", quests_.size(), cfg_.path);
        return {};
    }

    Result<void> QuestStore::save() const
    {
        std::string payload;
        try
        {
            payload = quests_to_json(quests_, cfg_.labels).dump(cfg_.indent);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(QuestError::io(std::string("Unable to serialize quests: ") + e.what()));
        }

        const fs::path target(cfg_.path);
        std::error_code ec;
        if (target.has_parent_path() && !fs::exists(target.parent_path(), ec))
        {
            fs::create_directories(target.parent_path(), ec);
            if (ec)
            {
                return std::unexpected(QuestError::io(std::format(
                    "Unable to create directory {}: {}", target.parent_path().string(), ec.message())));
            }
        }

        fs::path tmp = target;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::out | std::ios::trunc);
            if (!out.is_open())
            {
                return std::unexpected(QuestError::io("Unable to write quest file: " + tmp.string()));
            }
            out << payload << '\n';
            out.flush();
            if (!out)
            {
                return std::unexpected(QuestError::io("Failed writing quest file: " + tmp.string()));
            }
        }

        fs::rename(tmp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return std::unexpected(QuestError::io(std::format(
                "Unable to replace quest file {}: {}", cfg_.path, ec.message())));
        }
        logger()->debug("Saved {} quests to {}", quests_.size(), cfg_.path);
        return {};
    }

    Result<void> QuestStore::commit(std::vector<Quest> previous)
    {
        auto saved = save();
        if (!saved)
        {
            logger()->warn("Rolling back in-memory change: {}", saved.error().what());
            quests_ = std::move(previous);
        }
        return saved;
    }

    std::vector<Quest>::iterator QuestStore::find(const std::string &name)
    {
        return std::find_if(quests_.begin(), quests_.end(), [&](const Quest &q) { return q.name == name; });
    }

    std::vector<Quest>::const_iterator QuestStore::find(const std::string &name) const
    {
        return std::find_if(quests_.begin(), quests_.end(), [&](const Quest &q) { return q.name == name; });
    }

    Result<void> QuestStore::check_new_quest(const std::string &name, const std::string &description) const
    {
        if (is_blank(name))
        {
            return std::unexpected(QuestError::invalid_input("Quest name must not be empty"));
        }
        if (!is_valid_utf8(name) || !is_valid_utf8(description))
        {
            return std::unexpected(QuestError::invalid_input("Quest name and description must be valid UTF-8"));
        }
        if (find(name) != quests_.end())
        {
            return std::unexpected(QuestError::duplicate_name(std::format("Quest '{}' already exists", name)));
        }
        return {};
    }

    Result<void> QuestStore::add_quest(const std::string &name,
                                       const std::string &description,
                                       Priority priority)
    {
        auto valid = check_new_quest(name, description);
        if (!valid)
            return valid;

        auto previous = quests_;
        quests_.push_back(Quest{name, description, priority, false});
        auto saved = commit(std::move(previous));
        if (saved)
            logger()->info("Added quest '{}' ({})", name, priority_to_string(priority, cfg_.labels));
        return saved;
    }

    Result<void> QuestStore::add_quest(const std::string &name,
                                       const std::string &description,
                                       const std::string &priority)
    {
        auto valid = check_new_quest(name, description);
        if (!valid)
            return valid;
        auto parsed = priority_from_string(priority);
        if (!parsed)
            return std::unexpected(parsed.error());
        return add_quest(name, description, *parsed);
    }

    std::vector<Quest> QuestStore::list_quests_by_priority() const
    {
        return sort_by_priority(quests_);
    }

    Result<void> QuestStore::complete_quest(const std::string &name)
    {
        auto it = find(name);
        if (it == quests_.end())
        {
            return std::unexpected(QuestError::not_found(std::format("Quest '{}' not found", name)));
        }

        auto previous = quests_;
        it->done = true;
        auto saved = commit(std::move(previous));
        if (saved)
            logger()->info("Completed quest '{}'", name);
        return saved;
    }

    Result<void> QuestStore::remove_quest(const std::string &name)
    {
        auto it = find(name);
        if (it == quests_.end())
        {
            return std::unexpected(QuestError::not_found(std::format("Quest '{}' not found", name)));
        }

        auto previous = quests_;
        quests_.erase(it);
        auto saved = commit(std::move(previous));
        if (saved)
            logger()->info("Removed quest '{}'", name);
        return saved;
    }

    Result<std::vector<Quest>> QuestStore::list_filtered(const std::optional<std::string> &status,
                                                         const std::optional<std::string> &priority) const
    {
        std::optional<bool> want_done;
        if (status && !status->empty())
        {
            auto done = status_to_done(*status);
            if (!done)
                return std::unexpected(done.error());
            want_done = *done;
        }

        std::optional<Priority> want_priority;
        if (priority && !priority->empty())
        {
            auto parsed = priority_from_string(*priority);
            if (!parsed)
                return std::unexpected(parsed.error());
            want_priority = *parsed;
        }

        std::vector<Quest> out;
        std::copy_if(quests_.begin(), quests_.end(), std::back_inserter(out), [&](const Quest &q) {
            if (want_done && q.done != *want_done)
                return false;
            if (want_priority && q.priority != *want_priority)
                return false;
            return true;
        });
        return out;
    }

} // namespace questlog
