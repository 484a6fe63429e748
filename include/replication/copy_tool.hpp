#pragma once

#include "replication/chunk.hpp"
#include <string>
#include <memory>
#include <optional>
#include <chrono>

enum class ExitSeverity {
    Success,
    Warning,
    Error,
    Fatal
};

const char* exitSeverityToString(ExitSeverity severity);

struct ExitClassification {
    ExitSeverity severity{ExitSeverity::Success};
    bool shouldRetry{false};
    std::string message;
};

// Maps the copy tool's bitmask exit code onto the severity taxonomy.
ExitClassification classifyExitCode(int exitCode);

// A running copy-tool invocation
class CopyHandle {
public:
    virtual ~CopyHandle() = default;
    virtual std::string getLogPath() const = 0;
};

// External copy tool seam. Implementations own the process; the scheduler only
// starts, polls and waits.
class CopyTool {
public:
    virtual ~CopyTool() = default;

    virtual std::shared_ptr<CopyHandle> start(const Chunk& chunk, const std::string& logPath) = 0;
    // Exit code once finished, nullopt while still running
    virtual std::optional<int> poll(CopyHandle& handle) = 0;
    // Exit code, or nullopt if the timeout elapsed first
    virtual std::optional<int> wait(CopyHandle& handle, std::chrono::milliseconds timeout) = 0;
    virtual void terminate(CopyHandle& handle) = 0;
};
