#pragma once

#include "replication/copy_tool.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <sys/types.h>

class ProcessHandle : public CopyHandle {
public:
    ProcessHandle(pid_t pid, const std::string& logPath);

    std::string getLogPath() const override { return logPath_; }
    pid_t getPid() const { return pid_; }

private:
    friend class ProcessCopyTool;

    pid_t pid_;
    std::string logPath_;
    bool reaped_{false};
    int exitCode_{0};
    std::mutex mutex_;
};

// Runs the copy tool as a child process: "<tool> <source> <destination>
// <chunk args> /R:0 /W:0 /NP /LOG:<logPath>". Retries are the scheduler's job,
// so the tool's own retry loop is disabled.
class ProcessCopyTool : public CopyTool {
public:
    explicit ProcessCopyTool(const std::string& executable = "robocopy");

    std::shared_ptr<CopyHandle> start(const Chunk& chunk, const std::string& logPath) override;
    std::optional<int> poll(CopyHandle& handle) override;
    std::optional<int> wait(CopyHandle& handle, std::chrono::milliseconds timeout) override;
    void terminate(CopyHandle& handle) override;

    std::vector<std::string> buildArguments(const Chunk& chunk, const std::string& logPath) const;

private:
    std::optional<int> reap(ProcessHandle& handle, bool block);

    std::string executable_;
};
