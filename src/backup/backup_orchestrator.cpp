#include "backup/backup_orchestrator.hpp"
#include "backup/dependency_validator.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <string>
#include <vector>

BackupOrchestrator::BackupOrchestrator(std::shared_ptr<SyncProvider> provider)
    : provider_(provider) {
}

std::vector<std::string> BackupOrchestrator::buildOptions(const BackupConfig& config, const RunOptions& options) {
    // Archive mode, backups of replaced files, summary, human-readable sizes
    std::vector<std::string> opts = {
        "-abvh",
        "--delete",
        "--delete-excluded",
        "--recursive",
        "--exclude-from=" + config.excludeFile
    };

    if (options.verbose) {
        opts.push_back("-h");
        opts.push_back("--progress");
    }

    if (options.dryRun) {
        opts.push_back("--dry-run");
    }

    return opts;
}

SyncRequest BackupOrchestrator::buildRequest(const BackupConfig& config, const RunOptions& options,
                                             const std::string& logPath) {
    SyncRequest request;
    request.options = buildOptions(config, options);
    // Trailing slash copies the directory's contents, not the directory itself
    request.source = utils::withTrailingSlash(config.sourceDir);
    request.destination = utils::withTrailingSlash(config.backupDir);
    request.logPath = logPath;
    return request;
}

OperationResult BackupOrchestrator::run(const BackupConfig& config, const RunOptions& options) {
    setState(State::VALIDATING);

    DependencyValidator validator(config, provider_);
    OperationResult validation = validator.validate();
    if (!validation.ok()) {
        return fail(validation);
    }

    setState(State::READY);

    if (options.dryRun) {
        Logger::warning("Dry run mode enabled. Simulating backup without making changes.");
    }

    Logger::info("Starting backup from '" + config.sourceDir + "' to '" + config.backupDir + "'.");

    if (options.verbose) {
        Logger::debug("Verbose mode enabled.");
    }

    SyncRequest request = buildRequest(config, options, Logger::getLogPath());

    std::vector<std::string> commandLine;
    commandLine.push_back(provider_->getExecutable());
    commandLine.insert(commandLine.end(), request.options.begin(), request.options.end());
    commandLine.push_back(request.source);
    commandLine.push_back(request.destination);
    Logger::debug("Executing: " + utils::joinCommandLine(commandLine));

    setState(State::SYNCING);
    int status = provider_->sync(request);
    if (status != 0) {
        std::string message = provider_->getName() + " failed with exit code " + std::to_string(status);
        std::string detail = provider_->getLastError();
        if (!detail.empty()) {
            message += ": " + detail;
        }
        return fail(OperationResult::failure(ErrorKind::ExecutionFailure, message));
    }

    setState(State::SUCCEEDED);
    if (options.dryRun) {
        Logger::info("Dry run simulation finished successfully.");
    } else {
        Logger::info("Backup completed successfully.");
    }
    return OperationResult::success();
}

OperationResult BackupOrchestrator::fail(OperationResult result) {
    setState(State::FAILED);
    return result;
}

void BackupOrchestrator::setState(State state) {
    Logger::debug("State: " + stateToString(state_) + " -> " + stateToString(state));
    state_ = state;
}

std::string BackupOrchestrator::stateToString(State state) {
    switch (state) {
        case State::IDLE:       return "Idle";
        case State::VALIDATING: return "Validating";
        case State::READY:      return "Ready";
        case State::SYNCING:    return "Syncing";
        case State::SUCCEEDED:  return "Succeeded";
        case State::FAILED:     return "Failed";
        default:                return "Unknown";
    }
}
