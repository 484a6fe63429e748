#include "snapshot/snapshot_provider_factory.hpp"
#include "snapshot/lvm_snapshot_provider.hpp"
#include "snapshot/remote_snapshot_provider.hpp"
#include "common/utils.hpp"

std::unique_ptr<SnapshotProvider> createSnapshotProvider(const std::string& path, SnapshotTracker* tracker) {
    std::string host;
    std::string remotePath;
    if (utils::splitRemotePath(path, host, remotePath)) {
        return std::make_unique<RemoteSnapshotProvider>(host, tracker);
    }
    return std::make_unique<LvmSnapshotProvider>(tracker);
}
