#include "main/backup_main.hpp"
#include "backup/backup_cli.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_orchestrator.hpp"
#include "backup/config_loader.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

int runSession(const ParseResult& parsed, const BackupConfig& config,
               const std::string& programName, std::shared_ptr<SyncProvider> provider) {
    if (parsed.action == ParseResult::Action::ERROR) {
        Logger::error(parsed.error.message);
        Logger::debug(std::string("Failure category: ") + errorKindToString(parsed.error.error));
        return parsed.error.exitCode;
    }

    Logger::info("Script '" + programName + "' started.");

    BackupOrchestrator orchestrator(provider);
    OperationResult result = orchestrator.run(config, parsed.options);
    if (!result.ok()) {
        Logger::error(result.message);
        Logger::debug(std::string("Failure category: ") + errorKindToString(result.error));
        return result.exitCode;
    }

    Logger::info("Script '" + programName + "' finished.");
    return 0;
}

} // namespace

int backupMain(const std::vector<std::string>& args,
               const std::string& baseDir,
               const std::string& programName,
               std::shared_ptr<SyncProvider> provider) {
    ParseResult parsed = BackupCLI::parseArguments(args);
    if (parsed.action == ParseResult::Action::HELP) {
        BackupCLI::printUsage(std::cout, programName);
        return 0;
    }

    BackupConfig config;
    OperationResult loaded = ConfigLoader::load(ConfigLoader::configPathFor(baseDir), config);
    if (!loaded.ok()) {
        std::cerr << "FATAL: " << loaded.message << std::endl;
        std::cerr << "Please ensure '" << ConfigLoader::kConfigFileName
                  << "' exists in the same directory as the program." << std::endl;
        return loaded.exitCode;
    }

    std::string logPath = Logger::sessionLogPath(baseDir, programName, std::chrono::system_clock::now());
    if (!Logger::initialize(logPath)) {
        std::cerr << "FATAL: Could not start session log " << logPath
                  << " (file not creatable or a session is already active)" << std::endl;
        return 1;
    }

    int exitCode = 1;
    try {
        exitCode = runSession(parsed, config, programName, provider);
    } catch (const std::exception& e) {
        Logger::error("Unexpected error: " + std::string(e.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
