#pragma once

#include "replication/chunk.hpp"
#include "replication/replication_config.hpp"
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <filesystem>
#include <system_error>

struct PlanningWarning {
    std::string path;
    std::string reason;
};

struct ChunkPlan {
    std::vector<Chunk> chunks;
    std::vector<PlanningWarning> warnings;
    int64_t totalSize{0};
    int64_t totalFiles{0};
};

// Partitions a profile's source tree into chunks bounded by depth, file count
// and size. Every path under the source root lands in exactly one chunk.
class ChunkPlanner {
public:
    explicit ChunkPlanner(const SyncProfile& profile);
    virtual ~ChunkPlanner() = default;

    ChunkPlan plan();

    // Size and file count of a directory subtree, cached per planning pass
    struct DirectoryProfile {
        int64_t size{0};
        int64_t files{0};
        bool accessible{true};
    };

protected:
    // Entries of one directory. On error, entries holds what was read before it.
    virtual std::error_code listDirectory(const std::filesystem::path& dir,
                                          std::vector<std::filesystem::directory_entry>& entries);

private:
    DirectoryProfile profileDirectory(const std::filesystem::path& dir);
    void planDirectory(const std::filesystem::path& dir, int depth, ChunkPlan& plan);
    void emitChunk(const std::filesystem::path& dir, const DirectoryProfile& stats, bool filesOnly,
                   ChunkPlan& plan);
    bool fitsInChunk(const DirectoryProfile& stats) const;
    bool isExcludedDirectory(const std::filesystem::path& dir) const;
    void addWarning(const std::filesystem::path& path, const std::string& reason);
    std::filesystem::path destinationFor(const std::filesystem::path& dir) const;
    std::vector<std::string> buildCopyArgs(bool filesOnly) const;

    SyncProfile profile_;
    std::filesystem::path sourceRoot_;
    std::map<std::string, DirectoryProfile> cache_;
    std::vector<PlanningWarning> warnings_;
    int nextChunkId_{1};
};
