#pragma once

#include "backup/backup_config.hpp"
#include "common/backup_status.hpp"
#include <string>

class ConfigLoader {
public:
    static constexpr const char* kConfigFileName = "user-profile-backup.json";

    // Location of the configuration file inside the executable's directory
    static std::string configPathFor(const std::string& baseDir);

    // Reads and validates a JSON configuration. The three path keys are
    // required, anything else is rejected. `config` is only assigned on success.
    static OperationResult load(const std::string& path, BackupConfig& config);

private:
    static std::string resolvePath(const std::string& value, const std::string& configDir);
};
