#include "questlog/types.hpp"

namespace questlog
{

    std::string priority_to_string(Priority priority, PriorityLabels labels)
    {
        if (labels == PriorityLabels::Neutral)
        {
            switch (priority)
            {
            case Priority::High:
                return "high";
            case Priority::Medium:
                return "medium";
            case Priority::Low:
                return "low";
            }
            return "unknown";
        }

        switch (priority)
        {
        case Priority::High:
            return "alta";
        case Priority::Medium:
            return "média";
        case Priority::Low:
            return "baixa";
        }
        return "unknown";
    }

    Result<Priority> priority_from_string(const std::string &s)
    {
        if (s == "alta" || s == "high")
            return Priority::High;
        if (s == "média" || s == "media" || s == "medium")
            return Priority::Medium;
        if (s == "baixa" || s == "low")
            return Priority::Low;
        return std::unexpected(QuestError::invalid_input(std::format(
            "Invalid priority '{}': expected alta, média or baixa (high, medium or low)", s)));
    }

    Result<PriorityLabels> labels_from_string(const std::string &s)
    {
        if (s == "reference")
            return PriorityLabels::Reference;
        if (s == "neutral")
            return PriorityLabels::Neutral;
        return std::unexpected(QuestError::config(std::format(
            "Invalid priority labels '{}': expected reference or neutral", s)));
    }

    std::string labels_to_string(PriorityLabels labels)
    {
        switch (labels)
        {
        case PriorityLabels::Reference:
            return "reference";
        case PriorityLabels::Neutral:
            return "neutral";
        }
        return "unknown";
    }

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::DuplicateName:
            return "DuplicateName";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::CorruptData:
            return "CorruptData";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::ConfigError:
            return "ConfigError";
        }
        return "Unknown";
    }

} // namespace questlog
