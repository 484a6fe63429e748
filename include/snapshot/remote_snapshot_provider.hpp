#pragma once

#include "snapshot/lvm_snapshot_provider.hpp"
#include <string>

// LVM snapshots on another host, driven over non-interactive ssh. Volumes
// are qualified with the host ("server:/dev/vg/lv") so they never collide
// with local volume names.
class RemoteSnapshotProvider : public LvmSnapshotProvider {
public:
    explicit RemoteSnapshotProvider(const std::string& host, SnapshotTracker* tracker = nullptr);

    std::string getServerName() const override;
    std::string resolveVolume(const std::string& path) override;

    // Remote snapshots cannot be mounted locally
    OperationResult exposeSnapshot(Snapshot& snapshot, const std::string& mountPoint) override;
    OperationResult unexposeSnapshot(Snapshot& snapshot) override;

protected:
    int execute(const std::string& command, std::string& output) override;
    std::string deviceForVolume(const std::string& volume) const override;

private:
    std::string host_;
};
