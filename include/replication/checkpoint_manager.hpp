#pragma once

#include "common/operation_result.hpp"
#include "replication/chunk.hpp"
#include <string>
#include <vector>
#include <optional>
#include <mutex>

class OrchestrationState;

struct Checkpoint {
    std::string version;
    std::string sessionId;
    std::vector<std::string> completedChunkPaths;
    size_t completedCount{0};
    std::string savedAt;
};

// Persists the set of completed chunks so an interrupted run can resume.
// Saves are serialized and atomic: content goes to a temporary file that then
// replaces the checkpoint, so a partial file is never visible at the real path.
// Paths that are not valid UTF-8 are stored with U+FFFD replacements and
// matched in that form on resume; two such paths differing only in their
// invalid bytes are indistinguishable.
class CheckpointManager {
public:
    static constexpr const char* kVersion = "1.0";
    static constexpr const char* kFileName = "robocurse-checkpoint.json";

    // An empty directory means the active log directory, or the current
    // working directory when no log session is active.
    explicit CheckpointManager(const std::string& directory = "");

    OperationResult save(const OrchestrationState* state);

    // Absent when the file is missing, unreadable, malformed or of another version.
    std::optional<Checkpoint> load() const;

    // Returns whether a checkpoint file was present. A dry run only reports.
    bool remove(bool dryRun = false);

    std::string getCheckpointPath() const;
    void setDirectory(const std::string& directory);

    static bool isChunkCompleted(const Chunk& chunk, const std::optional<Checkpoint>& checkpoint);

private:
    std::string directory_;
    mutable std::mutex mutex_;
};
