#include "backup/dependency_validator.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>

DependencyValidator::DependencyValidator(const BackupConfig& config, std::shared_ptr<SyncProvider> provider)
    : config_(config)
    , provider_(provider) {
}

OperationResult DependencyValidator::validate() const {
    Logger::debug("Validating script dependencies...");

    OperationResult result = checkSyncTool();
    if (!result.ok()) {
        return result;
    }
    result = checkSourceDir();
    if (!result.ok()) {
        return result;
    }
    result = ensureBackupDir();
    if (!result.ok()) {
        return result;
    }
    result = checkExcludeFile();
    if (!result.ok()) {
        return result;
    }

    Logger::debug("All required dependencies found.");
    return OperationResult::success();
}

OperationResult DependencyValidator::checkSyncTool() const {
    if (!provider_ || !provider_->isAvailable()) {
        std::string name = provider_ ? provider_->getExecutable() : std::string("rsync");
        return OperationResult::failure(ErrorKind::DependencyMissing,
            "Required command '" + name + "' not found. Please install it.");
    }
    return OperationResult::success();
}

OperationResult DependencyValidator::checkSourceDir() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.sourceDir, ec)) {
        return OperationResult::failure(ErrorKind::DependencyMissing,
            "Source directory not found: " + config_.sourceDir);
    }
    return OperationResult::success();
}

OperationResult DependencyValidator::ensureBackupDir() const {
    std::error_code ec;
    if (std::filesystem::is_directory(config_.backupDir, ec)) {
        return OperationResult::success();
    }

    Logger::warning("Backup destination directory not found. Creating it: " + config_.backupDir);
    std::filesystem::create_directories(config_.backupDir, ec);
    std::error_code statEc;
    if (ec || !std::filesystem::is_directory(config_.backupDir, statEc)) {
        std::string reason = ec ? " (" + ec.message() + ")" : std::string();
        return OperationResult::failure(ErrorKind::DependencyMissing,
            "Failed to create backup destination directory: " + config_.backupDir + reason);
    }
    return OperationResult::success();
}

OperationResult DependencyValidator::checkExcludeFile() const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_.excludeFile, ec)) {
        return OperationResult::failure(ErrorKind::DependencyMissing,
            "Exclude file not found: " + config_.excludeFile);
    }
    return OperationResult::success();
}
