#include "main/backup_main.hpp"
#include "backup/rsync/rsync_provider.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    try {
        std::string programName = (argc > 0 && argv[0]) ?
            std::filesystem::path(argv[0]).filename().string() : std::string("user-profile-backup");

        std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
        auto provider = std::make_shared<RsyncProvider>();

        return backupMain(args, utils::executableDirectory(argc > 0 ? argv[0] : nullptr),
                          programName, provider);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }
}
