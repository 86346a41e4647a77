#pragma once

#include <string>
#include <vector>

// One invocation of the external synchronization tool
struct SyncRequest {
    std::vector<std::string> options;
    std::string source;
    std::string destination;
    std::string logPath;  // Receives the tool's stdout and stderr
};

class SyncProvider {
public:
    virtual ~SyncProvider() = default;

    virtual std::string getName() const = 0;
    virtual std::string getExecutable() const = 0;

    // True when the tool can be launched on this system
    virtual bool isAvailable() const = 0;

    // Blocks until the tool exits and returns its exit status.
    // Negative values mean the tool could not be launched at all.
    virtual int sync(const SyncRequest& request) = 0;

    // Error handling
    virtual std::string getLastError() const = 0;
    virtual void clearLastError() = 0;
};
