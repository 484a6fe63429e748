#include "replication/process_copy_tool.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

ProcessHandle::ProcessHandle(pid_t pid, const std::string& logPath)
    : pid_(pid)
    , logPath_(logPath) {
}

ProcessCopyTool::ProcessCopyTool(const std::string& executable)
    : executable_(executable) {
}

std::vector<std::string> ProcessCopyTool::buildArguments(const Chunk& chunk, const std::string& logPath) const {
    std::vector<std::string> args;
    args.push_back(executable_);
    args.push_back(chunk.sourcePath);
    args.push_back(chunk.destinationPath);
    args.insert(args.end(), chunk.copyArgs.begin(), chunk.copyArgs.end());
    args.push_back("/R:0");
    args.push_back("/W:0");
    args.push_back("/NP");
    if (!logPath.empty()) {
        args.push_back("/LOG:" + logPath);
    }
    return args;
}

std::shared_ptr<CopyHandle> ProcessCopyTool::start(const Chunk& chunk, const std::string& logPath) {
    std::vector<std::string> args = buildArguments(chunk, logPath);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    if (!logPath.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(logPath).parent_path(), ec);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Own process group: terminal signals go to the engine only
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDOUT_FILENO);
            ::dup2(devNull, STDERR_FILENO);
        }
        ::execvp(argv[0], argv.data());
        // 16 is the tool's own "serious error" code
        ::_exit(16);
    }

    // Also set from the parent so the group exists before start() returns.
    // EACCES means the child already exec'd, after setting it itself.
    if (::setpgid(pid, pid) != 0 && errno != EACCES) {
        Logger::warning("setpgid failed for copy tool pid " + std::to_string(pid) + ": " + std::strerror(errno));
    }

    Logger::debug("Started copy tool pid " + std::to_string(pid) + " for chunk "
                  + std::to_string(chunk.chunkId) + ": " + chunk.sourcePath);
    return std::make_shared<ProcessHandle>(pid, logPath);
}

std::optional<int> ProcessCopyTool::reap(ProcessHandle& handle, bool block) {
    std::lock_guard<std::mutex> lock(handle.mutex_);
    if (handle.reaped_) {
        return handle.exitCode_;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(handle.pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return std::nullopt;
    }
    if (result < 0) {
        Logger::error("waitpid failed for pid " + std::to_string(handle.pid_) + ": " + std::strerror(errno));
        handle.reaped_ = true;
        handle.exitCode_ = -1;
        return handle.exitCode_;
    }

    handle.reaped_ = true;
    if (WIFEXITED(status)) {
        handle.exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        handle.exitCode_ = -WTERMSIG(status);
    } else {
        handle.exitCode_ = -1;
    }
    return handle.exitCode_;
}

std::optional<int> ProcessCopyTool::poll(CopyHandle& handle) {
    auto& process = dynamic_cast<ProcessHandle&>(handle);
    return reap(process, false);
}

std::optional<int> ProcessCopyTool::wait(CopyHandle& handle, std::chrono::milliseconds timeout) {
    auto& process = dynamic_cast<ProcessHandle&>(handle);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto exitCode = reap(process, false);
        if (exitCode) {
            return exitCode;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

void ProcessCopyTool::terminate(CopyHandle& handle) {
    auto& process = dynamic_cast<ProcessHandle&>(handle);
    if (reap(process, false)) {
        return;
    }

    Logger::warning("Terminating copy tool pid " + std::to_string(process.getPid()));
    ::kill(process.getPid(), SIGTERM);
    if (!wait(process, std::chrono::seconds(10))) {
        ::kill(process.getPid(), SIGKILL);
        reap(process, true);
    }
}
