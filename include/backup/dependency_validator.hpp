#pragma once

#include "backup/backup_config.hpp"
#include "backup/sync_provider.hpp"
#include "common/backup_status.hpp"
#include <memory>

class DependencyValidator {
public:
    DependencyValidator(const BackupConfig& config, std::shared_ptr<SyncProvider> provider);

    // Checks, in order: sync tool present, source directory, backup directory
    // (created when missing), exclude file. Stops at the first failure.
    OperationResult validate() const;

private:
    OperationResult checkSyncTool() const;
    OperationResult checkSourceDir() const;
    OperationResult ensureBackupDir() const;
    OperationResult checkExcludeFile() const;

    const BackupConfig& config_;
    std::shared_ptr<SyncProvider> provider_;
};
