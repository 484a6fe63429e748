#pragma once

#include <string>

enum class ErrorKind {
    None,
    ValidationError,
    CopyToolError,
    CopyToolFatal,
    SnapshotError,
    CheckpointError,
    LockContentionError
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::ValidationError:     return "ValidationError";
        case ErrorKind::CopyToolError:       return "CopyToolError";
        case ErrorKind::CopyToolFatal:       return "CopyToolFatal";
        case ErrorKind::SnapshotError:       return "SnapshotError";
        case ErrorKind::CheckpointError:     return "CheckpointError";
        case ErrorKind::LockContentionError: return "LockContentionError";
        default:                             return "Unknown";
    }
}

// Outcome of a component-level operation. Failures carry a readable message
// and, where one is known, the underlying cause.
struct OperationResult {
    bool success{true};
    ErrorKind kind{ErrorKind::None};
    std::string message;
    std::string cause;

    static OperationResult ok(const std::string& message = "") {
        OperationResult result;
        result.message = message;
        return result;
    }

    static OperationResult failure(ErrorKind kind, const std::string& message,
                                   const std::string& cause = "") {
        OperationResult result;
        result.success = false;
        result.kind = kind;
        result.message = message;
        result.cause = cause;
        return result;
    }

    std::string describe() const {
        if (success) {
            return message.empty() ? "OK" : message;
        }
        std::string text = std::string(errorKindToString(kind)) + ": " + message;
        if (!cause.empty()) {
            text += " (" + cause + ")";
        }
        return text;
    }

    explicit operator bool() const { return success; }
};
