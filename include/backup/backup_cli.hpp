#pragma once

#include "backup/backup_config.hpp"
#include "common/backup_status.hpp"
#include <ostream>
#include <string>
#include <vector>

struct ParseResult {
    enum class Action {
        RUN,
        HELP,
        ERROR
    };

    Action action = Action::RUN;
    RunOptions options;
    OperationResult error;
};

class BackupCLI {
public:
    // Parses the arguments that follow the program name. Has no side effects;
    // an ERROR result always carries default options.
    static ParseResult parseArguments(const std::vector<std::string>& args);

    static void printUsage(std::ostream& out, const std::string& programName);

private:
    static ParseResult fail(const std::string& message);
};
