#pragma once

#include "replication/chunk.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <functional>

enum class Phase {
    Idle,
    Profiling,
    Chunking,
    Replicating,
    Complete,
    Stopped
};

const char* phaseToString(Phase phase);

struct FailedChunk {
    Chunk chunk;
    std::string cause;
};

// Consistent copy of the run record for progress readers
struct StateSnapshot {
    Phase phase{Phase::Idle};
    std::string sessionId;
    std::string currentProfile;
    int profileIndex{-1};
    int profileTotalChunks{0};
    size_t completedCount{0};
    size_t failedCount{0};
    size_t activeCount{0};
    size_t skippedCount{0};
    bool stopRequested{false};
    bool pauseRequested{false};
    std::chrono::system_clock::time_point startTime;
};

using PhaseCallback = std::function<void(Phase from, Phase to)>;

// The single shared record of run progress. Owned by the orchestrator and
// passed by reference to the scheduler and checkpoint manager; every access
// goes through the state mutex.
class OrchestrationState {
public:
    OrchestrationState();

    OrchestrationState(const OrchestrationState&) = delete;
    OrchestrationState& operator=(const OrchestrationState&) = delete;

    // Starts a new run: new session id, Idle phase, counters cleared
    void reset();

    bool transitionTo(Phase next);
    Phase getPhase() const;
    bool isTerminal() const;
    static bool isValidTransition(Phase from, Phase to);

    void beginProfile(const std::string& name, int index);
    void setProfileTotalChunks(int total);

    void chunkStarted();
    void chunkCompleted(const Chunk& chunk);
    void chunkFailed(const Chunk& chunk, const std::string& cause);
    // Active chunk is going back to the queue for another attempt
    void chunkRequeued();
    void chunkSkipped(const Chunk& chunk);

    // Paths already completed by an earlier interrupted run
    void setCarriedOverPaths(const std::vector<std::string>& paths);

    void requestStop();
    void requestPause();
    void requestResume();
    bool isStopRequested() const;
    bool isPauseRequested() const;

    // Blocks while paused, up to the timeout. Returns true once dispatch may continue.
    bool waitWhilePaused(std::chrono::milliseconds timeout) const;

    std::vector<Chunk> getCompletedChunks() const;
    std::vector<FailedChunk> getFailedChunks() const;
    // This run's completed paths followed by carried-over paths not already listed
    std::vector<std::string> getCheckpointPaths() const;
    std::string getSessionId() const;
    StateSnapshot snapshot() const;

    void setPhaseCallback(PhaseCallback callback);

    static std::string generateSessionId();

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable pauseCondition_;

    Phase phase_{Phase::Idle};
    std::string sessionId_;
    std::string currentProfile_;
    int profileIndex_{-1};
    int profileTotalChunks_{0};
    std::vector<Chunk> completedChunks_;
    std::vector<FailedChunk> failedChunks_;
    std::vector<std::string> carriedOverPaths_;
    size_t completedCount_{0};
    size_t failedCount_{0};
    size_t activeCount_{0};
    size_t skippedCount_{0};
    bool stopRequested_{false};
    bool pauseRequested_{false};
    std::chrono::system_clock::time_point startTime_;
    PhaseCallback phaseCallback_;
};
