#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace questlog
{

    /**
     * A single trackable quest.
     * On disk each quest is an object with exactly the keys
     * name, description, priority and done.
     */
    struct Quest
    {
        std::string name;
        std::string description;
        Priority priority{Priority::Medium};
        bool done{false};

        nlohmann::json to_json(PriorityLabels labels = PriorityLabels::Reference) const;

        /** Parse one quest object; any shape mismatch is CorruptData */
        static Result<Quest> from_json(const nlohmann::json &j);

        bool operator==(const Quest &other) const = default;
    };

    /** Serialize a collection as a JSON array, preserving order */
    nlohmann::json quests_to_json(const std::vector<Quest> &quests, PriorityLabels labels);

    /** Parse a JSON array of quest objects */
    Result<std::vector<Quest>> quests_from_json(const nlohmann::json &j);

    /** Stable copy ordered high, medium, low */
    std::vector<Quest> sort_by_priority(std::vector<Quest> quests);

} // namespace questlog
