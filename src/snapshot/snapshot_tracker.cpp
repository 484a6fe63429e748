#include "snapshot/snapshot_tracker.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

SnapshotTracker::SnapshotTracker(const std::string& path)
    : path_(path) {
}

std::vector<TrackedSnapshot> SnapshotTracker::loadEntries(OperationResult& result) const {
    std::vector<TrackedSnapshot> entries;
    result = OperationResult::ok();

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return entries;
    }

    try {
        std::stringstream buffer;
        buffer << file.rdbuf();
        json document = json::parse(buffer.str());
        for (const auto& item : document.at("Snapshots")) {
            TrackedSnapshot entry;
            entry.shadowId = item.at("ShadowId").get<std::string>();
            entry.volume = item.value("Volume", "");
            entry.serverName = item.value("ServerName", "Local");
            entry.exposedPath = item.value("ExposedPath", "");
            entry.ownerPid = static_cast<pid_t>(item.value("OwnerPid", 0));
            entries.push_back(entry);
        }
    } catch (const json::exception& e) {
        result = OperationResult::failure(ErrorKind::SnapshotError,
                                          "Snapshot tracking file " + path_ + " is unreadable", e.what());
        entries.clear();
    }
    return entries;
}

OperationResult SnapshotTracker::saveEntries(const std::vector<TrackedSnapshot>& entries) const {
    json snapshots = json::array();
    for (const auto& entry : entries) {
        snapshots.push_back({
            {"ShadowId", entry.shadowId},
            {"Volume", entry.volume},
            {"ServerName", entry.serverName},
            {"ExposedPath", entry.exposedPath},
            {"OwnerPid", static_cast<int>(entry.ownerPid)}
        });
    }

    std::string error;
    if (!utils::writeFileAtomically(path_, json{{"Snapshots", snapshots}}.dump(2), error)) {
        return OperationResult::failure(ErrorKind::SnapshotError, "Failed to save snapshot tracking " + path_, error);
    }
    return OperationResult::ok();
}

OperationResult SnapshotTracker::track(const Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    OperationResult loaded;
    auto entries = loadEntries(loaded);
    if (!loaded) {
        return loaded;
    }

    TrackedSnapshot tracked{snapshot.shadowId, snapshot.sourceVolume, snapshot.serverName,
                            snapshot.exposedPath, ::getpid()};
    auto it = std::find_if(entries.begin(), entries.end(), [&](const TrackedSnapshot& entry) {
        return entry.shadowId == snapshot.shadowId && entry.serverName == snapshot.serverName;
    });
    if (it != entries.end()) {
        *it = tracked;
    } else {
        entries.push_back(tracked);
    }
    return saveEntries(entries);
}

OperationResult SnapshotTracker::untrack(const std::string& shadowId, const std::string& serverName) {
    std::lock_guard<std::mutex> lock(mutex_);
    OperationResult loaded;
    auto entries = loadEntries(loaded);
    if (!loaded) {
        return loaded;
    }

    auto it = std::remove_if(entries.begin(), entries.end(), [&](const TrackedSnapshot& entry) {
        return entry.shadowId == shadowId && entry.serverName == serverName;
    });
    if (it == entries.end()) {
        return OperationResult::ok();
    }
    entries.erase(it, entries.end());
    return saveEntries(entries);
}

std::vector<TrackedSnapshot> SnapshotTracker::getTracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    OperationResult loaded;
    auto entries = loadEntries(loaded);
    if (!loaded) {
        Logger::warning(loaded.describe());
    }
    return entries;
}

bool SnapshotTracker::isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}
