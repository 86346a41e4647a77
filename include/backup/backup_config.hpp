#pragma once

#include <string>

struct BackupConfig {
    std::string sourceDir;    // Tree being mirrored, usually the user's home
    std::string backupDir;    // Mirror destination, created on demand
    std::string excludeFile;  // rsync --exclude-from pattern list
};

struct RunOptions {
    bool verbose = false;  // Adds rsync progress reporting
    bool dryRun = false;   // Simulate only, no changes at the destination
};
