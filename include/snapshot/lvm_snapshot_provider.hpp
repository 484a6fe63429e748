#pragma once

#include "snapshot/snapshot_provider.hpp"
#include <string>
#include <vector>

class SnapshotTracker;

// LVM copy-on-write snapshots of the logical volume holding a path. Snapshots
// are named "<lv>_robocurse_<timestamp>" inside the origin's volume group and
// identified by "<vg>/<name>".
class LvmSnapshotProvider : public SnapshotProvider {
public:
    static constexpr const char* kNameTag = "_robocurse_";

    explicit LvmSnapshotProvider(SnapshotTracker* tracker = nullptr);
    ~LvmSnapshotProvider() override = default;

    std::string getServerName() const override;
    std::string resolveVolume(const std::string& path) override;

    OperationResult listSnapshots(const std::string& volume, std::vector<Snapshot>& snapshots) override;
    OperationResult createSnapshot(const std::string& sourcePath, bool skipTracking, Snapshot& snapshot) override;
    OperationResult deleteSnapshot(const std::string& shadowId) override;

    OperationResult exposeSnapshot(Snapshot& snapshot, const std::string& mountPoint) override;
    OperationResult unexposeSnapshot(Snapshot& snapshot) override;

    // Parses lvs' lv_time column ("2024-01-31 18:02:11 +0100")
    static bool parseLvTime(const std::string& text, std::chrono::system_clock::time_point& time);

protected:
    // Runs a command on the provider's host with stderr folded into output
    virtual int execute(const std::string& command, std::string& output);

    // Device path on the provider's host for a volume identifier
    virtual std::string deviceForVolume(const std::string& volume) const;

    bool lookupLogicalVolume(const std::string& device, std::string& vgName, std::string& lvName,
                             std::string& error);

    SnapshotTracker* tracker_;
};
