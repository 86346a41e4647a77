#include "common/utils.hpp"
#include <filesystem>
#include <sstream>
#include <cstdlib>
#include <unistd.h>
#include <sys/stat.h>

namespace utils {

namespace {

bool isExecutableFile(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string();
}

void replaceAll(std::string& value, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string findExecutable(const std::string& name) {
    if (name.empty()) {
        return "";
    }

    if (name.find('/') != std::string::npos) {
        return isExecutableFile(name) ? name : "";
    }

    const char* pathEnv = std::getenv("PATH");
    std::string searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";

    std::stringstream ss(searchPath);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        // An empty PATH entry means the current directory
        std::filesystem::path candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;
        if (isExecutableFile(candidate.string())) {
            return candidate.string();
        }
    }
    return "";
}

std::string expandHome(const std::string& value) {
    std::string home = homeDirectory();
    if (home.empty()) {
        return value;
    }

    std::string result = value;
    if (result == "~") {
        result = home;
    } else if (result.compare(0, 2, "~/") == 0) {
        result = home + result.substr(1);
    }

    replaceAll(result, "${HOME}", home);

    // Bare $HOME only counts when the variable name ends there ($HOMER stays)
    const std::string bare = "$HOME";
    size_t pos = 0;
    while ((pos = result.find(bare, pos)) != std::string::npos) {
        size_t end = pos + bare.size();
        if (end == result.size() || result[end] == '/') {
            result.replace(pos, bare.size(), home);
            pos += home.size();
        } else {
            pos = end;
        }
    }
    return result;
}

std::string withTrailingSlash(const std::string& path) {
    std::string result = path;
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    if (result != "/") {
        result += '/';
    }
    return result;
}

std::string joinCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            line += "'" + arg + "'";
        } else {
            line += arg;
        }
    }
    return line;
}

std::string executableDirectory(const char* argv0) {
    std::error_code ec;

    // Directory of the path as invoked, without following symlinks
    if (argv0 != nullptr && argv0[0] != '\0') {
        std::string invoked(argv0);
        if (invoked.find('/') == std::string::npos) {
            invoked = findExecutable(invoked);
        }
        if (!invoked.empty()) {
            auto absolute = std::filesystem::absolute(std::filesystem::path(invoked), ec);
            if (!ec) {
                return absolute.lexically_normal().parent_path().string();
            }
        }
    }

    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.parent_path().string();
    }
    return std::filesystem::current_path().string();
}

} // namespace utils
