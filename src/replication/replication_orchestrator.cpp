#include "replication/replication_orchestrator.hpp"
#include "replication/chunk_planner.hpp"
#include "snapshot/retention_policy.hpp"
#include "snapshot/snapshot_provider_factory.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

bool RunSummary::succeeded() const {
    if (fatal || stopped || finalPhase != Phase::Complete) {
        return false;
    }
    return std::all_of(profiles.begin(), profiles.end(), [](const ProfileOutcome& outcome) {
        return outcome.result.success;
    });
}

ReplicationOrchestrator::ReplicationOrchestrator(const ReplicationConfig& config, CopyTool& copyTool)
    : config_(config)
    , copyTool_(copyTool)
    , profileLock_(config.settings.lockDirectory)
    , registry_(config.snapshotRegistryPath())
    , tracker_(config.snapshotTrackingPath())
    , providerFactory_(createSnapshotProvider)
    , mountRoot_(kSnapshotMountRoot) {
}

RunSummary ReplicationOrchestrator::run(const RunOptions& options) {
    RunSummary summary;
    const bool dryRun = options.dryRun || config_.settings.dryRun;

    state_.reset();
    summary.sessionId = state_.getSessionId();
    Logger::info("Starting replication session " + summary.sessionId + (dryRun ? " (dry run)" : ""));

    std::optional<Checkpoint> checkpoint;
    if (options.resume) {
        checkpoint = checkpointManager_.load();
        if (checkpoint) {
            state_.setCarriedOverPaths(checkpoint->completedChunkPaths);
        } else {
            Logger::info("No usable checkpoint at " + checkpointManager_.getCheckpointPath() + ", starting fresh");
        }
    }

    if (!dryRun) {
        cleanupOrphanedSnapshots();
    }

    std::vector<SyncProfile> profiles = selectProfiles(options, summary);
    state_.transitionTo(Phase::Profiling);

    RunOptions effective = options;
    effective.dryRun = dryRun;
    for (size_t i = 0; i < profiles.size(); ++i) {
        if (state_.isStopRequested()) {
            Logger::info("Stop requested, " + std::to_string(profiles.size() - i) + " profile(s) not started");
            if (!state_.isTerminal()) {
                state_.transitionTo(Phase::Stopped);
            }
            break;
        }
        if (state_.isTerminal()) {
            break;
        }
        if (summary.fatal) {
            for (size_t j = i; j < profiles.size(); ++j) {
                Logger::warning("Skipping profile '" + profiles[j].name + "' after a fatal error");
                ProfileOutcome skipped;
                skipped.name = profiles[j].name;
                skipped.result = OperationResult::failure(ErrorKind::CopyToolFatal,
                                                          "Skipped after a fatal error in an earlier profile");
                summary.profiles.push_back(skipped);
            }
            break;
        }

        if (state_.getPhase() != Phase::Profiling) {
            state_.transitionTo(Phase::Profiling);
        }
        ProfileOutcome outcome = runProfile(profiles[i], static_cast<int>(i), effective, checkpoint);
        summary.fatal = summary.fatal || outcome.schedule.fatal;
        summary.stopped = summary.stopped || outcome.schedule.stopped;
        summary.profiles.push_back(outcome);
    }

    if (!state_.isTerminal()) {
        state_.transitionTo(state_.isStopRequested() ? Phase::Stopped : Phase::Complete);
    }
    summary.finalPhase = state_.getPhase();
    summary.stopped = summary.stopped || summary.finalPhase == Phase::Stopped;

    if (summary.succeeded()) {
        checkpointManager_.remove(dryRun);
    }

    StateSnapshot finalState = state_.snapshot();
    Logger::info("Session " + summary.sessionId + " finished in phase " + phaseToString(summary.finalPhase)
                 + ": " + std::to_string(finalState.completedCount) + " chunk(s) completed, "
                 + std::to_string(finalState.failedCount) + " failed, "
                 + std::to_string(finalState.skippedCount) + " skipped");
    return summary;
}

std::vector<SyncProfile> ReplicationOrchestrator::selectProfiles(const RunOptions& options,
                                                                 RunSummary& summary) const {
    std::vector<SyncProfile> selected;
    if (options.profileNames.empty()) {
        for (const auto& profile : config_.profiles) {
            if (profile.enabled) {
                selected.push_back(profile);
            } else {
                Logger::info("Profile '" + profile.name + "' is disabled");
            }
        }
        return selected;
    }

    for (const auto& name : options.profileNames) {
        auto it = std::find_if(config_.profiles.begin(), config_.profiles.end(), [&](const SyncProfile& profile) {
            return utils::equalsIgnoreCase(profile.name, name);
        });
        if (it == config_.profiles.end()) {
            Logger::error("Profile '" + name + "' is not defined in " + config_.configPath);
            ProfileOutcome missing;
            missing.name = name;
            missing.result = OperationResult::failure(ErrorKind::ValidationError, "Unknown profile '" + name + "'");
            summary.profiles.push_back(missing);
            continue;
        }
        if (!it->enabled) {
            Logger::warning("Profile '" + it->name + "' is disabled, not running it");
            continue;
        }
        selected.push_back(*it);
    }
    return selected;
}

ProfileOutcome ReplicationOrchestrator::runProfile(const SyncProfile& profile, int index,
                                                   const RunOptions& options,
                                                   const std::optional<Checkpoint>& checkpoint) {
    ProfileOutcome outcome;
    outcome.name = profile.name;
    outcome.attempted = true;

    state_.beginProfile(profile.name, index);
    Logger::info("Profile '" + profile.name + "': " + profile.source + " -> " + profile.destination);

    outcome.result = validateProfile(profile);
    if (!outcome.result) {
        Logger::error(outcome.result.describe());
        return outcome;
    }

    std::string owner = ProfileLock::defaultOwner() + ":" + state_.getSessionId();
    outcome.result = profileLock_.registerRun(profile.name, owner);
    if (!outcome.result) {
        Logger::error(outcome.result.describe());
        return outcome;
    }

    const SnapshotSide sides[] = {SnapshotSide::Source, SnapshotSide::Destination};
    for (SnapshotSide side : sides) {
        OperationResult prepared = preparePersistentSnapshot(profile, side, options.dryRun);
        if (!prepared) {
            Logger::error(prepared.describe());
            profileLock_.unregisterRun(profile.name);
            outcome.result = prepared;
            return outcome;
        }
    }

    SyncProfile planning = profile;
    Snapshot temporary;
    if (profile.useTemporarySnapshot && !options.dryRun) {
        OperationResult prepared = prepareTemporarySnapshot(profile, temporary, planning.source);
        if (!prepared) {
            Logger::error(prepared.describe());
            profileLock_.unregisterRun(profile.name);
            outcome.result = prepared;
            return outcome;
        }
    }

    state_.transitionTo(Phase::Chunking);
    ChunkPlan plan = ChunkPlanner(planning).plan();
    for (const auto& warning : plan.warnings) {
        Logger::warning("Planning skipped " + warning.path + ": " + warning.reason);
    }
    Logger::info("Profile '" + profile.name + "' planned into " + std::to_string(plan.chunks.size())
                 + " chunk(s), " + std::to_string(plan.totalFiles) + " file(s), "
                 + std::to_string(plan.totalSize) + " byte(s)");

    SchedulerSettings settings;
    settings.profileName = profile.name;
    settings.maxConcurrentJobs = config_.settings.maxConcurrentJobs;
    settings.retryCount = config_.settings.retryCount;
    settings.retryDelay = std::chrono::seconds(config_.settings.retryDelaySeconds);
    settings.chunkTimeout = std::chrono::minutes(config_.settings.chunkTimeoutMinutes);
    settings.logDirectory = logDirectory_;
    settings.dryRun = options.dryRun;

    WorkerScheduler scheduler(state_, copyTool_, checkpointManager_, settings);
    if (progressCallback_) {
        scheduler.setProgressCallback(progressCallback_);
    }
    outcome.schedule = scheduler.run(plan.chunks, checkpoint);

    if (!temporary.shadowId.empty()) {
        releaseTemporarySnapshot(temporary);
    }
    profileLock_.unregisterRun(profile.name);

    if (outcome.schedule.fatal) {
        outcome.result = OperationResult::failure(ErrorKind::CopyToolFatal,
                                                  "Profile '" + profile.name + "' aborted",
                                                  outcome.schedule.fatalMessage);
    } else if (outcome.schedule.stopped) {
        outcome.result = OperationResult::failure(ErrorKind::None, "Profile '" + profile.name + "' stopped");
    } else if (outcome.schedule.failed > 0) {
        outcome.result = OperationResult::failure(ErrorKind::CopyToolError,
                                                  "Profile '" + profile.name + "' finished with "
                                                  + std::to_string(outcome.schedule.failed) + " failed chunk(s)");
    } else {
        outcome.result = OperationResult::ok("Profile '" + profile.name + "' completed");
    }
    Logger::info(outcome.result.describe());
    return outcome;
}

OperationResult ReplicationOrchestrator::preparePersistentSnapshot(const SyncProfile& profile, SnapshotSide side,
                                                                   bool dryRun) {
    const SnapshotSettings& settings =
        side == SnapshotSide::Source ? profile.sourceSnapshot : profile.destinationSnapshot;
    if (!settings.enabled) {
        return OperationResult::ok();
    }

    const std::string& path = side == SnapshotSide::Source ? profile.source : profile.destination;
    SnapshotProvider& provider = providerFor(path);
    std::string volume = provider.resolveVolume(path);

    int keepCount = RetentionPolicy::effectiveRetention(
        config_.profiles, volume, side,
        [this](const std::string& profilePath) { return providerFor(profilePath).resolveVolume(profilePath); });
    keepCount = std::max(keepCount, settings.retentionCount);

    RetentionOptions retentionOptions;
    retentionOptions.preCreate = true;
    retentionOptions.dryRun = dryRun;
    RetentionResult retention = RetentionPolicy(provider, registry_).enforce(volume, side, keepCount,
                                                                             retentionOptions);
    if (retention.registryError) {
        std::string cause = retention.errors.empty() ? std::string() : retention.errors.front();
        return OperationResult::failure(ErrorKind::SnapshotError,
                                        "Snapshot registry unusable, not creating a "
                                        + std::string(snapshotSideToString(side)) + " snapshot of " + volume,
                                        cause);
    }
    for (const auto& error : retention.errors) {
        Logger::warning("Retention on " + volume + ": " + error);
    }

    if (dryRun) {
        Logger::info("[DRY RUN] Would create a " + std::string(snapshotSideToString(side))
                     + " snapshot of " + volume);
        return OperationResult::ok();
    }

    Snapshot snapshot;
    OperationResult created = provider.createSnapshot(path, true, snapshot);
    if (!created) {
        return created;
    }

    // Retention already loaded the registry for this volume
    snapshot.registered = true;
    registry_.add(snapshot);
    OperationResult saved = registry_.save();
    if (!saved) {
        Logger::warning("Snapshot " + snapshot.shadowId + " was created but not registered: " + saved.describe());
    }
    return OperationResult::ok();
}

OperationResult ReplicationOrchestrator::prepareTemporarySnapshot(const SyncProfile& profile, Snapshot& snapshot,
                                                                  std::string& planningRoot) {
    SnapshotProvider& provider = providerFor(profile.source);
    OperationResult created = provider.createSnapshot(profile.source, false, snapshot);
    if (!created) {
        return created;
    }

    std::string mountPoint = (fs::path(mountRoot_) / utils::sanitizeName(profile.name)).string();
    OperationResult exposed = provider.exposeSnapshot(snapshot, mountPoint);
    if (!exposed) {
        releaseTemporarySnapshot(snapshot);
        return exposed;
    }

    // Record the mount so orphan cleanup can unmount it
    OperationResult tracked = tracker_.track(snapshot);
    if (!tracked) {
        Logger::warning(tracked.describe());
    }

    std::string device;
    std::string volumeMount;
    fs::path relative;
    if (utils::findMountForPath(profile.source, device, volumeMount)) {
        std::error_code ec;
        relative = fs::weakly_canonical(profile.source, ec).lexically_relative(volumeMount);
        if (ec || relative.empty() || relative == ".") {
            relative.clear();
        }
    }
    planningRoot = (fs::path(snapshot.exposedPath) / relative).lexically_normal().string();
    Logger::info("Profile '" + profile.name + "' reads from snapshot " + snapshot.shadowId + " at " + planningRoot);
    return OperationResult::ok();
}

void ReplicationOrchestrator::releaseTemporarySnapshot(Snapshot& snapshot) {
    SnapshotProvider* provider = providerForServer(snapshot.serverName);
    if (!provider) {
        Logger::error("No snapshot provider for " + snapshot.serverName + ", snapshot "
                      + snapshot.shadowId + " left for orphan cleanup");
        return;
    }

    OperationResult unexposed = provider->unexposeSnapshot(snapshot);
    if (!unexposed) {
        Logger::error(unexposed.describe());
    }
    OperationResult deleted = provider->deleteSnapshot(snapshot.shadowId);
    if (!deleted) {
        Logger::error("Temporary snapshot left for orphan cleanup: " + deleted.describe());
        return;
    }
    OperationResult untracked = tracker_.untrack(snapshot.shadowId, snapshot.serverName);
    if (!untracked) {
        Logger::warning(untracked.describe());
    }
}

void ReplicationOrchestrator::cleanupOrphanedSnapshots() {
    OrphanCleanupResult cleanup = tracker_.cleanupOrphans(
        [this](const std::string& serverName) { return providerForServer(serverName); });
    if (cleanup.deletedCount > 0) {
        Logger::info("Removed " + std::to_string(cleanup.deletedCount) + " orphaned temporary snapshot(s)");
    }
    for (const auto& error : cleanup.errors) {
        Logger::warning("Orphan cleanup: " + error);
    }
}

SnapshotProvider& ReplicationOrchestrator::providerFor(const std::string& path) {
    std::unique_ptr<SnapshotProvider> created = providerFactory_(path, &tracker_);
    std::string serverName = created->getServerName();
    auto it = providers_.find(utils::toLower(serverName));
    if (it != providers_.end()) {
        return *it->second;
    }
    SnapshotProvider& provider = *created;
    providers_[utils::toLower(serverName)] = std::move(created);
    return provider;
}

SnapshotProvider* ReplicationOrchestrator::providerForServer(const std::string& serverName) {
    auto it = providers_.find(utils::toLower(serverName));
    if (it != providers_.end()) {
        return it->second.get();
    }
    std::string path = utils::equalsIgnoreCase(serverName, "Local") ? std::string("/") : serverName + ":/";
    SnapshotProvider& provider = providerFor(path);
    return utils::equalsIgnoreCase(provider.getServerName(), serverName) ? &provider : nullptr;
}
