#pragma once

#include "backup/sync_provider.hpp"
#include <string>
#include <vector>

class RsyncProvider : public SyncProvider {
public:
    static constexpr int kExecFailedStatus = 127;

    explicit RsyncProvider(const std::string& executable = "rsync");
    ~RsyncProvider() override = default;

    std::string getName() const override { return "rsync"; }
    std::string getExecutable() const override { return executable_; }
    bool isAvailable() const override;
    int sync(const SyncRequest& request) override;

    std::string getLastError() const override { return lastError_; }
    void clearLastError() override { lastError_.clear(); }

    // Full argv as passed to exec, program name first
    std::vector<std::string> buildArgv(const SyncRequest& request) const;

private:
    std::string executable_;
    std::string lastError_;
};
