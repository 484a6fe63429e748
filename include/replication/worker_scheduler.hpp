#pragma once

#include "replication/chunk.hpp"
#include "replication/copy_tool.hpp"
#include "replication/checkpoint_manager.hpp"
#include "replication/orchestration_state.hpp"
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <functional>
#include <optional>

class ParallelTaskManager;

struct SchedulerSettings {
    std::string profileName;
    int maxConcurrentJobs{4};
    int retryCount{3};  // total attempts per chunk
    std::chrono::milliseconds retryDelay{std::chrono::seconds(5)};
    std::chrono::milliseconds chunkTimeout{std::chrono::hours(4)};
    std::chrono::milliseconds pollInterval{std::chrono::milliseconds(500)};
    std::string logDirectory;
    bool dryRun{false};
};

struct ScheduleResult {
    size_t planned{0};
    size_t skipped{0};
    size_t dispatched{0};
    size_t completed{0};
    size_t failed{0};
    size_t retried{0};
    bool fatal{false};
    bool stopped{false};
    std::string fatalMessage;

    bool succeeded() const { return !fatal && !stopped && failed == 0; }
};

using SchedulerProgressCallback = std::function<void(const StateSnapshot& snapshot)>;

// Drives copy-tool invocations for one profile's chunks with bounded
// concurrency. The calling thread is the coordinator; workers come from a
// ParallelTaskManager sized to maxConcurrentJobs.
class WorkerScheduler {
public:
    WorkerScheduler(OrchestrationState& state,
                    CopyTool& copyTool,
                    CheckpointManager& checkpointManager,
                    const SchedulerSettings& settings);

    ScheduleResult run(const std::vector<Chunk>& chunks, const std::optional<Checkpoint>& resumeFrom);

    void setProgressCallback(SchedulerProgressCallback callback) { progressCallback_ = std::move(callback); }

private:
    struct PendingChunk {
        Chunk chunk;
        int attempts{0};
        std::chrono::steady_clock::time_point notBefore;
    };

    bool dispatchNext(std::unique_lock<std::mutex>& lock, ParallelTaskManager& pool);
    void executeChunk(const PendingChunk& item);
    void finishChunk(const PendingChunk& item, int attempt, const ExitClassification& outcome);
    std::string chunkLogPath(const Chunk& chunk, int attempt) const;
    void reportProgress();

    OrchestrationState& state_;
    CopyTool& copyTool_;
    CheckpointManager& checkpointManager_;
    SchedulerSettings settings_;
    SchedulerProgressCallback progressCallback_;

    std::mutex mutex_;
    std::condition_variable completion_;
    std::deque<PendingChunk> pending_;
    size_t inFlight_{0};
    ScheduleResult result_;
};
