#pragma once

#include "types.hpp"
#include "quest.hpp"
#include "config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace questlog
{

    /**
     * Owns the quest collection and its JSON file mirror.
     *
     * The file is loaded once by open(). Every successful mutation rewrites
     * the whole file before returning; a failed write restores the previous
     * in-memory state so memory and disk never diverge. Validation always
     * happens before any mutation.
     */
    class QuestStore
    {
    public:
        /**
         * Open the store at cfg.path.
         * A missing file yields an empty collection. An existing file that is
         * not a JSON array of quests fails with CorruptData.
         */
        static Result<QuestStore> open(const StorageConfig &cfg);

        /**
         * Append a new pending quest.
         * Fails with InvalidInput on a blank name or text that is not UTF-8,
         * DuplicateName if the name is taken.
         */
        Result<void> add_quest(const std::string &name,
                               const std::string &description,
                               Priority priority = Priority::Medium);

        /** As above, with the priority given as a label; an unknown label is InvalidInput. */
        Result<void> add_quest(const std::string &name,
                               const std::string &description,
                               const std::string &priority);

        /** All quests in insertion order */
        const std::vector<Quest> &list_quests() const { return quests_; }

        /** Copy ordered high, medium, low; equal priorities keep insertion order */
        std::vector<Quest> list_quests_by_priority() const;

        /** Mark a quest done. NotFound if no quest has exactly this name. */
        Result<void> complete_quest(const std::string &name);

        /** Remove a quest. NotFound if no quest has exactly this name. */
        Result<void> remove_quest(const std::string &name);

        /**
         * Filter by status ("pending" or "done") and/or priority label.
         * Absent or empty filters match everything; filters compose by AND.
         */
        Result<std::vector<Quest>> list_filtered(const std::optional<std::string> &status = std::nullopt,
                                                 const std::optional<std::string> &priority = std::nullopt) const;

        const StorageConfig &config() const { return cfg_; }

    private:
        explicit QuestStore(StorageConfig cfg);

        Result<void> load();
        Result<void> save() const;
        Result<void> check_new_quest(const std::string &name, const std::string &description) const;
        Result<void> commit(std::vector<Quest> previous);

        std::vector<Quest>::iterator find(const std::string &name);
        std::vector<Quest>::const_iterator find(const std::string &name) const;

        StorageConfig cfg_;
        std::vector<Quest> quests_;
    };

} // namespace questlog
