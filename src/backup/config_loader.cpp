#include "backup/config_loader.hpp"
#include "common/utils.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

using json = nlohmann::json;

namespace {

const char* const kSourceDirKey = "sourceDir";
const char* const kBackupDirKey = "backupDir";
const char* const kExcludeFileKey = "excludeFile";

OperationResult readPathKey(const json& document, const char* key, std::string& value) {
    auto it = document.find(key);
    if (it == document.end()) {
        return OperationResult::failure(ErrorKind::ConfigInvalid,
            std::string("Missing required configuration key: '") + key + "'");
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        return OperationResult::failure(ErrorKind::ConfigInvalid,
            std::string("Configuration key '") + key + "' must be a non-empty string");
    }
    value = it->get<std::string>();
    return OperationResult::success();
}

} // namespace

std::string ConfigLoader::configPathFor(const std::string& baseDir) {
    return (std::filesystem::path(baseDir) / kConfigFileName).string();
}

OperationResult ConfigLoader::load(const std::string& path, BackupConfig& config) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return OperationResult::failure(ErrorKind::ConfigMissing,
            "Configuration file not found at: " + path);
    }

    std::ifstream file(path);
    if (!file) {
        return OperationResult::failure(ErrorKind::ConfigMissing,
            "Configuration file could not be opened: " + path);
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        return OperationResult::failure(ErrorKind::ConfigInvalid,
            "Malformed configuration file " + path + ": " + e.what());
    }

    if (!document.is_object()) {
        return OperationResult::failure(ErrorKind::ConfigInvalid,
            "Configuration file " + path + " must contain a JSON object");
    }

    static const std::set<std::string> knownKeys = {kSourceDirKey, kBackupDirKey, kExcludeFileKey};
    for (auto it = document.begin(); it != document.end(); ++it) {
        if (knownKeys.count(it.key()) == 0) {
            return OperationResult::failure(ErrorKind::ConfigInvalid,
                "Unknown configuration key: '" + it.key() + "'");
        }
    }

    BackupConfig loaded;
    OperationResult result = readPathKey(document, kSourceDirKey, loaded.sourceDir);
    if (!result.ok()) {
        return result;
    }
    result = readPathKey(document, kBackupDirKey, loaded.backupDir);
    if (!result.ok()) {
        return result;
    }
    result = readPathKey(document, kExcludeFileKey, loaded.excludeFile);
    if (!result.ok()) {
        return result;
    }

    std::string configDir = std::filesystem::path(path).parent_path().string();
    loaded.sourceDir = resolvePath(loaded.sourceDir, configDir);
    loaded.backupDir = resolvePath(loaded.backupDir, configDir);
    loaded.excludeFile = resolvePath(loaded.excludeFile, configDir);

    config = loaded;
    return OperationResult::success();
}

std::string ConfigLoader::resolvePath(const std::string& value, const std::string& configDir) {
    std::filesystem::path expanded(utils::expandHome(value));
    if (expanded.is_relative() && !configDir.empty()) {
        expanded = std::filesystem::path(configDir) / expanded;
    }
    return expanded.lexically_normal().string();
}
