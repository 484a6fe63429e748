#pragma once

#include "common/operation_result.hpp"
#include "snapshot/snapshot_provider.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <mutex>

struct RegistryEntry {
    std::string shadowId;
    std::string volume;
    std::string serverName;
    std::chrono::system_clock::time_point createdAt;
};

// Persisted set of the persistent snapshots this installation created, keyed
// by shadow id and server. Anything not listed here is an external snapshot.
class SnapshotRegistry {
public:
    static constexpr const char* kVersion = "1.0";

    explicit SnapshotRegistry(const std::string& path);

    // A missing file loads as an empty registry
    OperationResult load();
    // Refused after a failed load so an unreadable file is never replaced
    OperationResult save();
    bool isLoadFailed() const;

    bool contains(const std::string& shadowId, const std::string& serverName) const;
    void add(const Snapshot& snapshot);
    bool remove(const std::string& shadowId, const std::string& serverName);
    std::vector<RegistryEntry> entriesForVolume(const std::string& volume, const std::string& serverName) const;
    std::vector<RegistryEntry> getEntries() const;
    std::string getPath() const { return path_; }

private:
    std::string path_;
    std::vector<RegistryEntry> entries_;
    bool loadFailed_{false};
    mutable std::mutex mutex_;
};
