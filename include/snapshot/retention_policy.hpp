#pragma once

#include "replication/replication_config.hpp"
#include "snapshot/snapshot_provider.hpp"
#include "snapshot/snapshot_registry.hpp"
#include <string>
#include <vector>
#include <functional>

struct RetentionOptions {
    // Leave room for the snapshot about to be created
    bool preCreate{true};
    bool dryRun{false};
};

struct RetentionResult {
    int deletedCount{0};
    int keptCount{0};
    int externalCount{0};
    // The registry could not be read; nothing was deleted
    bool registryError{false};
    std::vector<std::string> errors;

    bool succeeded() const { return errors.empty(); }
};

using VolumeResolver = std::function<std::string(const std::string& path)>;

// Prunes the registered snapshots of one volume down to a keep count, oldest
// first. Snapshots missing from the registry are external and never deleted.
class RetentionPolicy {
public:
    RetentionPolicy(SnapshotProvider& provider, SnapshotRegistry& registry);

    RetentionResult enforce(const std::string& volume, SnapshotSide side, int keepCount,
                            const RetentionOptions& options = RetentionOptions());

    // Largest retention count among enabled profiles whose snapshot side is
    // enabled and whose path on that side resolves to the volume; 0 if none.
    static int effectiveRetention(const std::vector<SyncProfile>& profiles, const std::string& volume,
                                  SnapshotSide side, const VolumeResolver& resolver);

private:
    SnapshotProvider& provider_;
    SnapshotRegistry& registry_;
};
