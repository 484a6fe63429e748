#include "snapshot/retention_policy.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>

RetentionPolicy::RetentionPolicy(SnapshotProvider& provider, SnapshotRegistry& registry)
    : provider_(provider), registry_(registry) {
}

RetentionResult RetentionPolicy::enforce(const std::string& volume, SnapshotSide side, int keepCount,
                                         const RetentionOptions& options) {
    RetentionResult result;
    const std::string server = provider_.getServerName();
    const std::string label = std::string(snapshotSideToString(side)) + " volume " + volume + " on " + server;

    OperationResult loaded = registry_.load();
    if (!loaded) {
        // Without the registry nothing can be told apart from external snapshots
        result.registryError = true;
        result.errors.push_back(loaded.describe());
        return result;
    }

    std::vector<Snapshot> listed;
    OperationResult listResult = provider_.listSnapshots(volume, listed);
    if (!listResult) {
        result.errors.push_back(listResult.describe());
        return result;
    }

    std::vector<Snapshot> registered;
    for (auto& snapshot : listed) {
        snapshot.registered = registry_.contains(snapshot.shadowId, server);
        if (snapshot.registered) {
            registered.push_back(snapshot);
        } else {
            result.externalCount++;
        }
    }

    // Drop registry entries whose snapshot no longer exists
    bool pruned = false;
    for (const auto& entry : registry_.entriesForVolume(volume, server)) {
        bool present = std::any_of(registered.begin(), registered.end(), [&](const Snapshot& snapshot) {
            return utils::equalsIgnoreCase(snapshot.shadowId, entry.shadowId);
        });
        if (!present && !options.dryRun) {
            Logger::info("Removing stale registry entry " + entry.shadowId + " for " + label);
            registry_.remove(entry.shadowId, server);
            pruned = true;
        }
    }
    if (pruned) {
        OperationResult saved = registry_.save();
        if (!saved) {
            result.errors.push_back(saved.describe());
        }
    }

    std::sort(registered.begin(), registered.end(), [](const Snapshot& a, const Snapshot& b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt > b.createdAt;
        }
        return a.shadowId > b.shadowId;
    });

    int target = std::max(0, options.preCreate ? keepCount - 1 : keepCount);
    int excess = static_cast<int>(registered.size()) - target;
    Logger::info("Retention for " + label + ": " + std::to_string(registered.size()) + " registered, "
                 + std::to_string(result.externalCount) + " external, keeping " + std::to_string(target));

    // Oldest first
    for (int i = static_cast<int>(registered.size()) - 1; excess > 0 && i >= 0; --i, --excess) {
        const Snapshot& snapshot = registered[i];
        if (options.dryRun) {
            Logger::info("Dry run: would delete snapshot " + snapshot.shadowId + " from " + label);
            result.deletedCount++;
            continue;
        }

        OperationResult deleted = provider_.deleteSnapshot(snapshot.shadowId);
        if (!deleted) {
            Logger::error("Retention could not delete " + snapshot.shadowId + ": " + deleted.describe());
            result.errors.push_back(deleted.describe());
            continue;
        }

        registry_.remove(snapshot.shadowId, server);
        OperationResult saved = registry_.save();
        if (!saved) {
            result.errors.push_back(saved.describe());
        }
        result.deletedCount++;
    }

    result.keptCount = static_cast<int>(registered.size()) - result.deletedCount;
    return result;
}

int RetentionPolicy::effectiveRetention(const std::vector<SyncProfile>& profiles, const std::string& volume,
                                        SnapshotSide side, const VolumeResolver& resolver) {
    int effective = 0;
    for (const auto& profile : profiles) {
        const SnapshotSettings& settings =
            side == SnapshotSide::Source ? profile.sourceSnapshot : profile.destinationSnapshot;
        if (!profile.enabled || !settings.enabled) {
            continue;
        }
        const std::string& path = side == SnapshotSide::Source ? profile.source : profile.destination;
        if (utils::equalsIgnoreCase(resolver(path), volume)) {
            effective = std::max(effective, settings.retentionCount);
        }
    }
    return effective;
}
