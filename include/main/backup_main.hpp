#pragma once

#include "backup/sync_provider.hpp"
#include <memory>
#include <string>
#include <vector>

// Runs one backup session and returns the process exit code.
// `args` excludes the program name; `baseDir` holds the configuration file
// and receives the session log.
int backupMain(const std::vector<std::string>& args,
               const std::string& baseDir,
               const std::string& programName,
               std::shared_ptr<SyncProvider> provider);
