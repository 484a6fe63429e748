#pragma once

#include "common/operation_result.hpp"
#include <string>
#include <vector>
#include <cstdint>

enum class ScanMode {
    Flat,
    Smart
};

enum class SnapshotSide {
    Source,
    Destination
};

inline const char* snapshotSideToString(SnapshotSide side) {
    return side == SnapshotSide::Source ? "Source" : "Destination";
}

// Persistent snapshot settings for one side of a profile
struct SnapshotSettings {
    bool enabled{false};
    int retentionCount{3};
};

// Options passed through to the copy tool for every chunk of a profile
struct CopyOptions {
    std::vector<std::string> switches;
    std::vector<std::string> excludeFiles;
    std::vector<std::string> excludeDirs;
};

struct SyncProfile {
    std::string name;
    std::string source;
    std::string destination;
    bool enabled{true};
    ScanMode scanMode{ScanMode::Smart};
    int chunkMaxDepth{5};
    int64_t chunkMaxFiles{50000};
    int64_t chunkMaxSizeBytes{10LL * 1024 * 1024 * 1024};
    CopyOptions copyOptions;
    SnapshotSettings sourceSnapshot;
    SnapshotSettings destinationSnapshot;
    bool useTemporarySnapshot{false};  // consistent source view for this run only
};

struct GlobalSettings {
    int maxConcurrentJobs{4};
    int retryCount{3};
    int retryDelaySeconds{5};
    int chunkTimeoutMinutes{240};
    std::string logPath{"/var/log/robocurse/robocurse.log"};
    std::string lockDirectory{"/tmp"};
    std::string copyToolPath{"robocopy"};
    bool dryRun{false};
};

struct ReplicationConfig {
    GlobalSettings settings;
    std::vector<SyncProfile> profiles;
    std::string configPath;

    // Registry of persistent snapshots, stored next to the configuration
    std::string snapshotRegistryPath() const;
    // Orphan tracking for temporary snapshots, stored next to the configuration
    std::string snapshotTrackingPath() const;
};

OperationResult loadConfig(const std::string& path, ReplicationConfig& config);
OperationResult parseConfig(const std::string& text, ReplicationConfig& config);
OperationResult validateProfile(const SyncProfile& profile);
bool parseScanMode(const std::string& text, ScanMode& mode);
