#include "snapshot/snapshot_registry.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

SnapshotRegistry::SnapshotRegistry(const std::string& path)
    : path_(path) {
}

OperationResult SnapshotRegistry::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    loadFailed_ = false;

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return OperationResult::ok("No snapshot registry at " + path_);
    }

    try {
        std::stringstream buffer;
        buffer << file.rdbuf();
        json document = json::parse(buffer.str());

        if (!document.is_object() || document.value("Version", "") != kVersion) {
            loadFailed_ = true;
            return OperationResult::failure(ErrorKind::SnapshotError,
                                            "Snapshot registry " + path_ + " has an unsupported format");
        }

        for (const auto& item : document.at("Snapshots")) {
            RegistryEntry entry;
            entry.shadowId = item.at("ShadowId").get<std::string>();
            entry.volume = item.value("Volume", "");
            entry.serverName = item.value("ServerName", "Local");
            if (!utils::parseIso8601(item.value("CreatedAt", ""), entry.createdAt)) {
                Logger::warning("Registry entry " + entry.shadowId + " has no valid CreatedAt");
            }
            entries_.push_back(entry);
        }
        return OperationResult::ok();
    } catch (const json::exception& e) {
        entries_.clear();
        loadFailed_ = true;
        return OperationResult::failure(ErrorKind::SnapshotError,
                                        "Snapshot registry " + path_ + " is unreadable", e.what());
    }
}

OperationResult SnapshotRegistry::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadFailed_) {
        return OperationResult::failure(ErrorKind::SnapshotError,
                                        "Not overwriting snapshot registry " + path_ + " after a failed load");
    }

    json snapshots = json::array();
    for (const auto& entry : entries_) {
        snapshots.push_back({
            {"ShadowId", entry.shadowId},
            {"Volume", entry.volume},
            {"ServerName", entry.serverName},
            {"CreatedAt", utils::formatIso8601(entry.createdAt)}
        });
    }
    json document = {{"Version", kVersion}, {"Snapshots", snapshots}};

    std::string error;
    if (!utils::writeFileAtomically(path_, document.dump(2), error)) {
        return OperationResult::failure(ErrorKind::SnapshotError, "Failed to save snapshot registry " + path_, error);
    }
    return OperationResult::ok();
}

bool SnapshotRegistry::isLoadFailed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadFailed_;
}

bool SnapshotRegistry::contains(const std::string& shadowId, const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [&](const RegistryEntry& entry) {
        return utils::equalsIgnoreCase(entry.shadowId, shadowId)
            && utils::equalsIgnoreCase(entry.serverName, serverName);
    });
}

void SnapshotRegistry::add(const Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (utils::equalsIgnoreCase(entry.shadowId, snapshot.shadowId)
            && utils::equalsIgnoreCase(entry.serverName, snapshot.serverName)) {
            return;
        }
    }
    entries_.push_back(RegistryEntry{snapshot.shadowId, snapshot.sourceVolume, snapshot.serverName,
                                     snapshot.createdAt});
}

bool SnapshotRegistry::remove(const std::string& shadowId, const std::string& serverName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(entries_.begin(), entries_.end(), [&](const RegistryEntry& entry) {
        return utils::equalsIgnoreCase(entry.shadowId, shadowId)
            && utils::equalsIgnoreCase(entry.serverName, serverName);
    });
    bool removed = it != entries_.end();
    entries_.erase(it, entries_.end());
    return removed;
}

std::vector<RegistryEntry> SnapshotRegistry::entriesForVolume(const std::string& volume,
                                                              const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RegistryEntry> result;
    for (const auto& entry : entries_) {
        if (utils::equalsIgnoreCase(entry.volume, volume) && utils::equalsIgnoreCase(entry.serverName, serverName)) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<RegistryEntry> SnapshotRegistry::getEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}
