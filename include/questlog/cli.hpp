#pragma once

#include "types.hpp"
#include "quest.hpp"
#include <ostream>
#include <string>

namespace questlog::cli
{
    /** Exit codes returned by run() besides CLI11's own parse error codes */
    enum ExitCode : int
    {
        kSuccess = 0,
        kRejected = 1,
        kUsage = 2,
        kFailure = 3
    };

    /** Map an error kind to the process exit code */
    int exit_code_for(const QuestError &error);

    /** One list line: name, description, status and priority */
    std::string render_quest(const Quest &quest, PriorityLabels labels);

    int run(int argc, const char *const *argv, std::ostream &out, std::ostream &err);

    int run(int argc, char *argv[]);

} // namespace questlog::cli
