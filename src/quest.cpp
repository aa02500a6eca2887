#include "questlog/quest.hpp"
#include <algorithm>
#include <format>

namespace questlog
{

    using Json = nlohmann::json;

    Json Quest::to_json(PriorityLabels labels) const
    {
        return Json{
            {"name", name},
            {"description", description},
            {"priority", priority_to_string(priority, labels)},
            {"done", done}};
    }

    Result<Quest> Quest::from_json(const Json &j)
    {
        if (!j.is_object())
        {
            return std::unexpected(QuestError::corrupt_data(
                std::format("Quest entry must be an object, got {}", j.type_name())));
        }

        try
        {
            Quest quest;
            quest.name = j.at("name").get<std::string>();
            quest.description = j.at("description").get<std::string>();
            quest.done = j.at("done").get<bool>();

            auto priority = priority_from_string(j.at("priority").get<std::string>());
            if (!priority)
            {
                return std::unexpected(QuestError::corrupt_data(
                    std::format("Quest '{}': {}", quest.name, priority.error().what())));
            }
            quest.priority = *priority;
            return quest;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(QuestError::corrupt_data(std::string("Malformed quest entry: ") + e.what()));
        }
    }

    Json quests_to_json(const std::vector<Quest> &quests, PriorityLabels labels)
    {
        Json arr = Json::array();
        for (const auto &q : quests)
        {
            arr.push_back(q.to_json(labels));
        }
        return arr;
    }

    Result<std::vector<Quest>> quests_from_json(const Json &j)
    {
        if (!j.is_array())
        {
            return std::unexpected(QuestError::corrupt_data(
                std::format("Quest file must contain a JSON array, got {}", j.type_name())));
        }

        std::vector<Quest> out;
        out.reserve(j.size());
        for (const auto &entry : j)
        {
            auto quest = Quest::from_json(entry);
            if (!quest)
                return std::unexpected(quest.error());

            bool duplicate = std::any_of(out.begin(), out.end(), [&](const Quest &q) {
                return q.name == quest->name;
            });
            if (duplicate)
            {
                return std::unexpected(QuestError::corrupt_data(
                    std::format("Duplicate quest name '{}' in quest file", quest->name)));
            }
            out.push_back(std::move(*quest));
        }
        return out;
    }

    std::vector<Quest> sort_by_priority(std::vector<Quest> quests)
    {
        std::stable_sort(quests.begin(), quests.end(), [](const Quest &lhs, const Quest &rhs) {
            return static_cast<int>(lhs.priority) < static_cast<int>(rhs.priority);
        });
        return quests;
    }

} // namespace questlog
