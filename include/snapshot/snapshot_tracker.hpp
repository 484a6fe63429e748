#pragma once

#include "common/operation_result.hpp"
#include "snapshot/snapshot_provider.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <sys/types.h>

struct TrackedSnapshot {
    std::string shadowId;
    std::string volume;
    std::string serverName;
    std::string exposedPath;
    pid_t ownerPid{0};
};

struct OrphanCleanupResult {
    int deletedCount{0};
    int skippedCount{0};
    std::vector<std::string> errors;
};

// Records temporary snapshots while they exist so a crashed run's leftovers
// can be removed at the next start. Persistent snapshots never appear here.
class SnapshotTracker {
public:
    explicit SnapshotTracker(const std::string& path);

    OperationResult track(const Snapshot& snapshot);
    OperationResult untrack(const std::string& shadowId, const std::string& serverName);
    std::vector<TrackedSnapshot> getTracked() const;

    // Deletes tracked snapshots whose owning process is gone. providerFor maps a
    // server name to the provider that can delete on it.
    template<typename ProviderLookup>
    OrphanCleanupResult cleanupOrphans(ProviderLookup providerFor);

private:
    std::vector<TrackedSnapshot> loadEntries(OperationResult& result) const;
    OperationResult saveEntries(const std::vector<TrackedSnapshot>& entries) const;
    static bool isProcessAlive(pid_t pid);

    std::string path_;
    mutable std::mutex mutex_;
};

template<typename ProviderLookup>
OrphanCleanupResult SnapshotTracker::cleanupOrphans(ProviderLookup providerFor) {
    OrphanCleanupResult result;
    for (const auto& entry : getTracked()) {
        if (isProcessAlive(entry.ownerPid)) {
            result.skippedCount++;
            continue;
        }

        SnapshotProvider* provider = providerFor(entry.serverName);
        if (!provider) {
            result.errors.push_back("No snapshot provider for server " + entry.serverName);
            continue;
        }

        if (!entry.exposedPath.empty()) {
            Snapshot exposed;
            exposed.shadowId = entry.shadowId;
            exposed.exposedPath = entry.exposedPath;
            OperationResult unmounted = provider->unexposeSnapshot(exposed);
            if (!unmounted) {
                result.errors.push_back(unmounted.describe());
            }
        }

        OperationResult deleted = provider->deleteSnapshot(entry.shadowId);
        if (!deleted) {
            result.errors.push_back(deleted.describe());
            continue;
        }

        OperationResult untracked = untrack(entry.shadowId, entry.serverName);
        if (!untracked) {
            result.errors.push_back(untracked.describe());
        }
        result.deletedCount++;
    }
    return result;
}
