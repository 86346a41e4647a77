#include "backup/rsync/rsync_provider.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

RsyncProvider::RsyncProvider(const std::string& executable)
    : executable_(executable) {
}

bool RsyncProvider::isAvailable() const {
    return !utils::findExecutable(executable_).empty();
}

std::vector<std::string> RsyncProvider::buildArgv(const SyncRequest& request) const {
    std::vector<std::string> argv;
    argv.reserve(request.options.size() + 3);
    argv.push_back(executable_);
    argv.insert(argv.end(), request.options.begin(), request.options.end());
    argv.push_back(request.source);
    argv.push_back(request.destination);
    return argv;
}

int RsyncProvider::sync(const SyncRequest& request) {
    clearLastError();

    std::vector<std::string> argv = buildArgv(request);
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int logFd = -1;
    if (!request.logPath.empty()) {
        logFd = open(request.logPath.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (logFd < 0) {
            lastError_ = "Failed to open log file " + request.logPath + ": " + strerror(errno);
            return -1;
        }
    }

    // Same treatment as system(3): the child takes the terminal's interrupt,
    // the parent survives it to report the failure.
    struct sigaction ignore;
    struct sigaction oldInt;
    struct sigaction oldQuit;
    memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &oldInt);
    sigaction(SIGQUIT, &ignore, &oldQuit);

    pid_t pid = fork();
    if (pid < 0) {
        lastError_ = std::string("fork failed: ") + strerror(errno);
        sigaction(SIGINT, &oldInt, nullptr);
        sigaction(SIGQUIT, &oldQuit, nullptr);
        if (logFd >= 0) {
            close(logFd);
        }
        return -1;
    }

    if (pid == 0) {
        sigaction(SIGINT, &oldInt, nullptr);
        sigaction(SIGQUIT, &oldQuit, nullptr);

        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        if (logFd >= 0) {
            dup2(logFd, STDOUT_FILENO);
            dup2(logFd, STDERR_FILENO);
        }
        execvp(args[0], args.data());
        _exit(kExecFailedStatus);
    }

    if (logFd >= 0) {
        close(logFd);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    sigaction(SIGINT, &oldInt, nullptr);
    sigaction(SIGQUIT, &oldQuit, nullptr);

    if (waited < 0) {
        lastError_ = std::string("waitpid failed: ") + strerror(errno);
        return -1;
    }

    if (WIFEXITED(status)) {
        int exitCode = WEXITSTATUS(status);
        if (exitCode == kExecFailedStatus) {
            lastError_ = "could not execute " + executable_;
        }
        return exitCode;
    }

    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        lastError_ = executable_ + " terminated by signal " + std::to_string(sig)
                     + " (" + strsignal(sig) + ")";
        return 128 + sig;
    }

    lastError_ = executable_ + " ended in an unknown state";
    return -1;
}
