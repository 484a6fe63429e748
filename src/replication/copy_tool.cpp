#include "replication/copy_tool.hpp"

const char* exitSeverityToString(ExitSeverity severity) {
    switch (severity) {
        case ExitSeverity::Success: return "Success";
        case ExitSeverity::Warning: return "Warning";
        case ExitSeverity::Error:   return "Error";
        case ExitSeverity::Fatal:   return "Fatal";
        default:                    return "Unknown";
    }
}

ExitClassification classifyExitCode(int exitCode) {
    ExitClassification result;

    // Negative: killed by signal -exitCode, or the exit status was lost
    if (exitCode < 0) {
        result.severity = ExitSeverity::Error;
        result.shouldRetry = true;
        result.message = "Copy tool terminated abnormally (exit " + std::to_string(exitCode) + ")";
        return result;
    }

    // 16: serious error, nothing was copied
    if (exitCode & 16) {
        result.severity = ExitSeverity::Fatal;
        result.message = "Fatal copy error (exit " + std::to_string(exitCode) + ")";
        return result;
    }

    // 8: some files or directories could not be copied
    if (exitCode & 8) {
        result.severity = ExitSeverity::Error;
        result.shouldRetry = true;
        result.message = "Some files failed to copy (exit " + std::to_string(exitCode) + ")";
        return result;
    }

    // 4: mismatched files or directories were detected
    if (exitCode & 4) {
        result.severity = ExitSeverity::Warning;
        result.message = "Mismatched files detected (exit " + std::to_string(exitCode) + ")";
        return result;
    }

    // 0-3: nothing to do, files copied, extra files present
    result.severity = ExitSeverity::Success;
    if (exitCode == 0) {
        result.message = "No changes";
    } else {
        result.message = "Copied successfully (exit " + std::to_string(exitCode) + ")";
    }
    return result;
}
