#pragma once

#include "common/operation_result.hpp"
#include <string>
#include <vector>
#include <chrono>

// A point-in-time copy of a volume
struct Snapshot {
    std::string shadowId;
    std::string sourceVolume;
    std::chrono::system_clock::time_point createdAt;
    std::string serverName{"Local"};
    bool registered{false};
    std::string exposedPath;  // read-only mount of the snapshot, when exposed
};

class SnapshotTracker;

// Creates, enumerates and deletes snapshots on one host. Snapshots created
// without skipTracking are temporary and recorded in the orphan tracker;
// persistent snapshots are created with skipTracking and registered by the caller.
class SnapshotProvider {
public:
    virtual ~SnapshotProvider() = default;

    virtual std::string getServerName() const = 0;

    // Volume identifier for a path on this provider's host
    virtual std::string resolveVolume(const std::string& path) = 0;

    virtual OperationResult listSnapshots(const std::string& volume, std::vector<Snapshot>& snapshots) = 0;
    virtual OperationResult createSnapshot(const std::string& sourcePath, bool skipTracking, Snapshot& snapshot) = 0;
    virtual OperationResult deleteSnapshot(const std::string& shadowId) = 0;

    // Mounts a snapshot read-only and sets snapshot.exposedPath
    virtual OperationResult exposeSnapshot(Snapshot& snapshot, const std::string& mountPoint) {
        (void)mountPoint;
        return OperationResult::failure(ErrorKind::SnapshotError,
                                        "Snapshot " + snapshot.shadowId + " cannot be exposed on " + getServerName());
    }

    virtual OperationResult unexposeSnapshot(Snapshot& snapshot) {
        snapshot.exposedPath.clear();
        return OperationResult::ok();
    }
};
