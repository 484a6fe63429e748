#pragma once

#include "common/operation_result.hpp"
#include "common/profile_lock.hpp"
#include "replication/checkpoint_manager.hpp"
#include "replication/copy_tool.hpp"
#include "replication/orchestration_state.hpp"
#include "replication/replication_config.hpp"
#include "replication/worker_scheduler.hpp"
#include "snapshot/snapshot_provider.hpp"
#include "snapshot/snapshot_registry.hpp"
#include "snapshot/snapshot_tracker.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>

struct RunOptions {
    // Profile names to run; empty runs every enabled profile
    std::vector<std::string> profileNames;
    bool dryRun{false};
    bool resume{false};
};

struct ProfileOutcome {
    std::string name;
    bool attempted{false};
    OperationResult result;
    ScheduleResult schedule;
};

struct RunSummary {
    std::string sessionId;
    Phase finalPhase{Phase::Idle};
    std::vector<ProfileOutcome> profiles;
    bool fatal{false};
    bool stopped{false};

    bool succeeded() const;
};

using SnapshotProviderFactory =
    std::function<std::unique_ptr<SnapshotProvider>(const std::string& path, SnapshotTracker* tracker)>;

// Runs the selected profiles one after another: duplicate-run guard,
// snapshots and retention, chunk planning, then the worker scheduler. Owns
// the shared orchestration state for the whole run.
class ReplicationOrchestrator {
public:
    static constexpr const char* kSnapshotMountRoot = "/tmp/robocurse-snapshots";

    ReplicationOrchestrator(const ReplicationConfig& config, CopyTool& copyTool);

    ReplicationOrchestrator(const ReplicationOrchestrator&) = delete;
    ReplicationOrchestrator& operator=(const ReplicationOrchestrator&) = delete;

    RunSummary run(const RunOptions& options);

    void requestStop() { state_.requestStop(); }
    void requestPause() { state_.requestPause(); }
    void requestResume() { state_.requestResume(); }

    OrchestrationState& getState() { return state_; }
    CheckpointManager& getCheckpointManager() { return checkpointManager_; }

    void setSnapshotProviderFactory(SnapshotProviderFactory factory) { providerFactory_ = std::move(factory); }
    void setCheckpointDirectory(const std::string& directory) { checkpointManager_.setDirectory(directory); }
    void setLogDirectory(const std::string& directory) { logDirectory_ = directory; }
    void setSnapshotMountRoot(const std::string& directory) { mountRoot_ = directory; }
    void setProgressCallback(SchedulerProgressCallback callback) { progressCallback_ = std::move(callback); }

private:
    std::vector<SyncProfile> selectProfiles(const RunOptions& options, RunSummary& summary) const;
    ProfileOutcome runProfile(const SyncProfile& profile, int index, const RunOptions& options,
                              const std::optional<Checkpoint>& checkpoint);
    OperationResult preparePersistentSnapshot(const SyncProfile& profile, SnapshotSide side, bool dryRun);
    OperationResult prepareTemporarySnapshot(const SyncProfile& profile, Snapshot& snapshot,
                                             std::string& planningRoot);
    void releaseTemporarySnapshot(Snapshot& snapshot);
    void cleanupOrphanedSnapshots();

    SnapshotProvider& providerFor(const std::string& path);
    SnapshotProvider* providerForServer(const std::string& serverName);

    ReplicationConfig config_;
    CopyTool& copyTool_;
    OrchestrationState state_;
    CheckpointManager checkpointManager_;
    ProfileLock profileLock_;
    SnapshotRegistry registry_;
    SnapshotTracker tracker_;
    SnapshotProviderFactory providerFactory_;
    std::map<std::string, std::unique_ptr<SnapshotProvider>> providers_;
    std::string logDirectory_;
    std::string mountRoot_;
    SchedulerProgressCallback progressCallback_;
};
