#pragma once

#include "backup/sync_provider.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <sys/stat.h>

namespace fs = std::filesystem;

// Scratch directory removed when the test ends
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = fs::temp_directory_path() / ("profile-backup-test-" + std::to_string(gen()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeScript(const fs::path& path, const std::string& body) {
    writeFile(path, "#!/bin/sh\n" + body);
    chmod(path.c_str(), 0755);
}

inline void writeConfig(const fs::path& dir, const nlohmann::json& document) {
    writeFile(dir / "user-profile-backup.json", document.dump(2));
}

inline std::vector<fs::path> listLogFiles(const fs::path& dir) {
    std::vector<fs::path> logs;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".log") {
            logs.push_back(entry.path());
        }
    }
    return logs;
}

// SHA-256 over every relative path and file body under `root`, in sorted order
inline std::string treeDigest(const fs::path& root) {
    std::vector<fs::path> entries;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        entries.push_back(fs::relative(entry.path(), root));
    }
    std::sort(entries.begin(), entries.end());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }

    for (const auto& relative : entries) {
        std::string name = relative.string();
        EVP_DigestUpdate(ctx.get(), name.data(), name.size() + 1);
        fs::path full = root / relative;
        if (fs::is_regular_file(full)) {
            std::string body = readFile(full);
            EVP_DigestUpdate(ctx.get(), body.data(), body.size());
        }
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

// Records every invocation instead of launching anything
class SpySyncProvider : public SyncProvider {
public:
    explicit SpySyncProvider(int exitCode = 0, bool available = true)
        : exitCode_(exitCode), available_(available) {}

    std::string getName() const override { return "rsync"; }
    std::string getExecutable() const override { return "rsync"; }
    bool isAvailable() const override { return available_; }

    int sync(const SyncRequest& request) override {
        requests.push_back(request);
        return exitCode_;
    }

    std::string getLastError() const override { return lastError; }
    void clearLastError() override { lastError.clear(); }

    int invocationCount() const { return static_cast<int>(requests.size()); }

    std::vector<SyncRequest> requests;
    std::string lastError;

private:
    int exitCode_;
    bool available_;
};
