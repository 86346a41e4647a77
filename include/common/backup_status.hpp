#pragma once

#include <string>
#include <utility>

enum class ErrorKind {
    None,
    ConfigMissing,
    ConfigInvalid,
    DependencyMissing,
    ArgumentError,
    ExecutionFailure
};

// Outcome of one step of a run. Only the entry point turns it into a process exit code.
struct OperationResult {
    ErrorKind error = ErrorKind::None;
    std::string message;
    int exitCode = 0;

    bool ok() const { return error == ErrorKind::None; }

    static OperationResult success() {
        return OperationResult{};
    }

    static OperationResult failure(ErrorKind kind, std::string message, int exitCode = 1) {
        OperationResult result;
        result.error = kind;
        result.message = std::move(message);
        result.exitCode = exitCode;
        return result;
    }
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::ConfigMissing:     return "ConfigMissing";
        case ErrorKind::ConfigInvalid:     return "ConfigInvalid";
        case ErrorKind::DependencyMissing: return "DependencyMissing";
        case ErrorKind::ArgumentError:     return "ArgumentError";
        case ErrorKind::ExecutionFailure:  return "ExecutionFailure";
        default:                           return "Unknown";
    }
}
