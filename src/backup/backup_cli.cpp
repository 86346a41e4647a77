#include "backup/backup_cli.hpp"
#include <iostream>
#include <string>
#include <vector>

ParseResult BackupCLI::parseArguments(const std::vector<std::string>& args) {
    RunOptions options;
    bool endOfOptions = false;

    for (const auto& arg : args) {
        if (endOfOptions) {
            return fail("Unexpected argument: '" + arg + "'. This script does not accept positional arguments.");
        }

        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-d" || arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "-h" || arg == "--help") {
            ParseResult result;
            result.action = ParseResult::Action::HELP;
            return result;
        } else if (arg == "--") {
            endOfOptions = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return fail("Unknown or invalid option: '" + arg + "'. Use -h for help.");
        } else {
            return fail("Unexpected argument: '" + arg + "'. This script does not accept positional arguments.");
        }
    }

    ParseResult result;
    result.action = ParseResult::Action::RUN;
    result.options = options;
    return result;
}

void BackupCLI::printUsage(std::ostream& out, const std::string& programName) {
    out << "Usage: " << programName << " [OPTIONS]\n"
        << "Performs a robust backup of the user's home directory.\n"
        << "\n"
        << "Options:\n"
        << "  -v, --verbose    Enable verbose output from rsync.\n"
        << "  -d, --dry-run    Simulate backup without making actual changes.\n"
        << "  -h, --help       Display this help message and exit.\n"
        << "\n"
        << "Examples:\n"
        << "  " << programName << " --verbose\n"
        << "  " << programName << " -d\n"
        << "\n";
}

ParseResult BackupCLI::fail(const std::string& message) {
    ParseResult result;
    result.action = ParseResult::Action::ERROR;
    result.error = OperationResult::failure(ErrorKind::ArgumentError, message);
    return result;
}
