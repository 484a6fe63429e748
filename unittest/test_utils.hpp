#pragma once

#include "replication/copy_tool.hpp"
#include "snapshot/snapshot_provider.hpp"
#include "common/utils.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <stdexcept>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Scratch directory removed when the test ends
class TempDirectory {
public:
    TempDirectory() {
        std::string pattern = (std::filesystem::temp_directory_path() / "robocurse-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline void writeTestFile(const std::filesystem::path& path, size_t bytes = 16) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << std::string(bytes, 'x');
}

inline void writeTestFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
}

class FakeCopyHandle : public CopyHandle {
public:
    FakeCopyHandle(const Chunk& chunk, const std::string& logPath, int exitCode)
        : chunk_(chunk), logPath_(logPath), exitCode_(exitCode) {}

    std::string getLogPath() const override { return logPath_; }
    const Chunk& getChunk() const { return chunk_; }
    int getExitCode() const { return exitCode_; }

private:
    Chunk chunk_;
    std::string logPath_;
    int exitCode_;
};

// Copy tool that never touches the filesystem. The exit code for each
// invocation comes from exitCodeFor(chunk, attempt), attempt counting from 1.
// Returning kTimeout makes wait() report a timeout.
class FakeCopyTool : public CopyTool {
public:
    static constexpr int kTimeout = -1000;

    std::function<int(const Chunk&, int)> exitCodeFor = [](const Chunk&, int) { return 1; };
    std::chrono::milliseconds runTime{0};

    std::shared_ptr<CopyHandle> start(const Chunk& chunk, const std::string& logPath) override {
        int attempt;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempt = ++attempts_[chunk.sourcePath];
            started_.push_back(chunk.sourcePath);
            logPaths_.push_back(logPath);
            running_++;
            maxRunning_ = std::max(maxRunning_, running_);
        }
        return std::make_shared<FakeCopyHandle>(chunk, logPath, exitCodeFor(chunk, attempt));
    }

    std::optional<int> poll(CopyHandle& handle) override {
        return static_cast<FakeCopyHandle&>(handle).getExitCode();
    }

    std::optional<int> wait(CopyHandle& handle, std::chrono::milliseconds timeout) override {
        (void)timeout;
        if (runTime.count() > 0) {
            std::this_thread::sleep_for(runTime);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_--;
        }
        int exitCode = static_cast<FakeCopyHandle&>(handle).getExitCode();
        if (exitCode == kTimeout) {
            return std::nullopt;
        }
        return exitCode;
    }

    void terminate(CopyHandle& handle) override {
        (void)handle;
        terminated_++;
    }

    std::vector<std::string> getStarted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    std::vector<std::string> getLogPaths() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logPaths_;
    }

    int getAttempts(const std::string& sourcePath) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attempts_.find(sourcePath);
        return it == attempts_.end() ? 0 : it->second;
    }

    int getMaxRunning() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return maxRunning_;
    }

    int getTerminated() const { return terminated_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, int> attempts_;
    std::vector<std::string> started_;
    std::vector<std::string> logPaths_;
    int running_{0};
    int maxRunning_{0};
    std::atomic<int> terminated_{0};
};

// In-memory snapshot host. Volumes are whatever resolveVolume maps paths to.
class FakeSnapshotProvider : public SnapshotProvider {
public:
    explicit FakeSnapshotProvider(const std::string& serverName = "Local")
        : serverName_(serverName) {}

    std::map<std::string, std::string> volumeByPath;
    std::vector<std::string> failDeletes;

    std::string getServerName() const override { return serverName_; }

    std::string resolveVolume(const std::string& path) override {
        auto it = volumeByPath.find(path);
        return it == volumeByPath.end() ? path : it->second;
    }

    OperationResult listSnapshots(const std::string& volume, std::vector<Snapshot>& snapshots) override {
        snapshots.clear();
        for (const auto& snapshot : snapshots_) {
            if (utils::equalsIgnoreCase(snapshot.sourceVolume, volume)) {
                snapshots.push_back(snapshot);
            }
        }
        return OperationResult::ok();
    }

    OperationResult createSnapshot(const std::string& sourcePath, bool skipTracking, Snapshot& snapshot) override {
        (void)skipTracking;
        snapshot = addExisting(resolveVolume(sourcePath), std::chrono::system_clock::now());
        return OperationResult::ok();
    }

    OperationResult deleteSnapshot(const std::string& shadowId) override {
        if (std::find(failDeletes.begin(), failDeletes.end(), shadowId) != failDeletes.end()) {
            return OperationResult::failure(ErrorKind::SnapshotError, "Cannot delete " + shadowId);
        }
        auto it = std::find_if(snapshots_.begin(), snapshots_.end(),
                               [&](const Snapshot& snapshot) { return snapshot.shadowId == shadowId; });
        if (it == snapshots_.end()) {
            return OperationResult::failure(ErrorKind::SnapshotError, "No snapshot " + shadowId);
        }
        snapshots_.erase(it);
        deleted_.push_back(shadowId);
        return OperationResult::ok();
    }

    OperationResult exposeSnapshot(Snapshot& snapshot, const std::string& mountPoint) override {
        snapshot.exposedPath = mountPoint;
        return OperationResult::ok();
    }

    Snapshot addExisting(const std::string& volume, std::chrono::system_clock::time_point createdAt) {
        Snapshot snapshot;
        snapshot.shadowId = "snap-" + std::to_string(++nextId_);
        snapshot.sourceVolume = volume;
        snapshot.createdAt = createdAt;
        snapshot.serverName = serverName_;
        snapshots_.push_back(snapshot);
        return snapshot;
    }

    bool exists(const std::string& shadowId) const {
        return std::any_of(snapshots_.begin(), snapshots_.end(),
                           [&](const Snapshot& snapshot) { return snapshot.shadowId == shadowId; });
    }

    size_t count() const { return snapshots_.size(); }
    const std::vector<std::string>& getDeleted() const { return deleted_; }

private:
    std::string serverName_;
    std::vector<Snapshot> snapshots_;
    std::vector<std::string> deleted_;
    int nextId_{0};
};
