#pragma once

#include "backup/backup_config.hpp"
#include "backup/sync_provider.hpp"
#include "common/backup_status.hpp"
#include <memory>
#include <string>
#include <vector>

class BackupOrchestrator {
public:
    enum class State {
        IDLE,
        VALIDATING,
        READY,
        SYNCING,
        SUCCEEDED,
        FAILED
    };

    explicit BackupOrchestrator(std::shared_ptr<SyncProvider> provider);

    // Validates the environment, then mirrors sourceDir into backupDir.
    // The sync tool's output is appended to the current session log.
    OperationResult run(const BackupConfig& config, const RunOptions& options);

    State getState() const { return state_; }

    static std::vector<std::string> buildOptions(const BackupConfig& config, const RunOptions& options);
    static SyncRequest buildRequest(const BackupConfig& config, const RunOptions& options,
                                    const std::string& logPath);
    static std::string stateToString(State state);

private:
    OperationResult fail(OperationResult result);
    void setState(State state);

    std::shared_ptr<SyncProvider> provider_;
    State state_{State::IDLE};
};
