#include "snapshot/remote_snapshot_provider.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

RemoteSnapshotProvider::RemoteSnapshotProvider(const std::string& host, SnapshotTracker* tracker)
    : LvmSnapshotProvider(tracker), host_(host) {
}

std::string RemoteSnapshotProvider::getServerName() const {
    return host_;
}

int RemoteSnapshotProvider::execute(const std::string& command, std::string& output) {
    std::string remote = "ssh -o BatchMode=yes " + utils::shellQuote(host_) + " " + utils::shellQuote(command);
    Logger::debug("Executing on " + host_ + ": " + command);
    return utils::runCommand(remote + " 2>&1", output);
}

std::string RemoteSnapshotProvider::resolveVolume(const std::string& path) {
    std::string host;
    std::string remotePath;
    if (!utils::splitRemotePath(path, host, remotePath)) {
        remotePath = path;
    }

    std::string output;
    int status = execute("findmnt -n -o SOURCE --target " + utils::shellQuote(remotePath), output);
    size_t end = output.find_first_of("\r\n");
    std::string device = output.substr(0, end);
    if (status != 0 || device.empty()) {
        Logger::warning("Cannot resolve the volume of " + remotePath + " on " + host_ + ", using the path prefix");
        return utils::volumeForPath(path);
    }
    return host_ + ":" + device;
}

std::string RemoteSnapshotProvider::deviceForVolume(const std::string& volume) const {
    std::string prefix = host_ + ":";
    if (volume.size() > prefix.size() && utils::equalsIgnoreCase(volume.substr(0, prefix.size()), prefix)) {
        return volume.substr(prefix.size());
    }
    return volume;
}

OperationResult RemoteSnapshotProvider::exposeSnapshot(Snapshot& snapshot, const std::string& mountPoint) {
    return SnapshotProvider::exposeSnapshot(snapshot, mountPoint);
}

OperationResult RemoteSnapshotProvider::unexposeSnapshot(Snapshot& snapshot) {
    return SnapshotProvider::unexposeSnapshot(snapshot);
}
