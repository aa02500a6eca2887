#pragma once

#include <expected>
#include <string>
#include <stdexcept>
#include <format>

namespace questlog
{

    /**
     * Quest priority, ordered from most to least urgent.
     */
    enum class Priority
    {
        High = 0,
        Medium = 1,
        Low = 2
    };

    /**
     * Vocabulary used when priorities are written to disk or shown to the user.
     * Reference is the Portuguese vocabulary (alta/média/baixa).
     */
    enum class PriorityLabels
    {
        Reference,
        Neutral
    };

    /**
     * Convert Priority to its label in the given vocabulary
     */
    std::string priority_to_string(Priority priority, PriorityLabels labels = PriorityLabels::Reference);

    /**
     * Errors for questlog operations
     */
    enum class ErrorCode
    {
        InvalidInput,
        DuplicateName,
        NotFound,
        CorruptData,
        IOError,
        ConfigError
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * questlog error with code and message
     */
    class QuestError : public std::runtime_error
    {
    public:
        ErrorCode code;

        QuestError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static QuestError invalid_input(const std::string &msg)
        {
            return QuestError(ErrorCode::InvalidInput, msg);
        }

        static QuestError duplicate_name(const std::string &msg)
        {
            return QuestError(ErrorCode::DuplicateName, msg);
        }

        static QuestError not_found(const std::string &msg)
        {
            return QuestError(ErrorCode::NotFound, msg);
        }

        static QuestError corrupt_data(const std::string &msg)
        {
            return QuestError(ErrorCode::CorruptData, msg);
        }

        static QuestError io(const std::string &msg)
        {
            return QuestError(ErrorCode::IOError, msg);
        }

        static QuestError config(const std::string &msg)
        {
            return QuestError(ErrorCode::ConfigError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, QuestError>;

    /**
     * Parse a priority label. Both vocabularies are accepted, plus "media"
     * without the accent.
     */
    Result<Priority> priority_from_string(const std::string &s);

    /**
     * Parse a label vocabulary name ("reference" or "neutral")
     */
    Result<PriorityLabels> labels_from_string(const std::string &s);

    std::string labels_to_string(PriorityLabels labels);

} // namespace questlog
