#include "replication/chunk_planner.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <fnmatch.h>

namespace fs = std::filesystem;

ChunkPlanner::ChunkPlanner(const SyncProfile& profile)
    : profile_(profile)
    , sourceRoot_(fs::path(profile.source).lexically_normal()) {
}

ChunkPlan ChunkPlanner::plan() {
    cache_.clear();
    warnings_.clear();
    nextChunkId_ = 1;

    ChunkPlan result;
    std::error_code ec;
    if (!fs::is_directory(sourceRoot_, ec)) {
        addWarning(sourceRoot_, ec ? ec.message() : "source root is not a directory");
        result.warnings = warnings_;
        return result;
    }

    if (fs::directory_iterator(sourceRoot_, ec) == fs::directory_iterator()) {
        if (ec) {
            addWarning(sourceRoot_, ec.message());
        } else {
            Logger::info("Source tree " + sourceRoot_.string() + " is empty, nothing to plan");
        }
        result.warnings = warnings_;
        return result;
    }

    DirectoryProfile rootStats = profileDirectory(sourceRoot_);
    result.totalSize = rootStats.size;
    result.totalFiles = rootStats.files;

    if (profile_.scanMode == ScanMode::Flat) {
        emitChunk(sourceRoot_, rootStats, false, result);
    } else {
        planDirectory(sourceRoot_, 0, result);
    }

    result.warnings = warnings_;
    Logger::info("Planned " + std::to_string(result.chunks.size()) + " chunk(s) for profile '"
                 + profile_.name + "' (" + std::to_string(result.totalFiles) + " files, "
                 + std::to_string(result.totalSize) + " bytes, "
                 + std::to_string(result.warnings.size()) + " warning(s))");
    return result;
}

ChunkPlanner::DirectoryProfile ChunkPlanner::profileDirectory(const fs::path& dir) {
    auto cached = cache_.find(dir.string());
    if (cached != cache_.end()) {
        return cached->second;
    }

    DirectoryProfile stats;
    std::vector<fs::directory_entry> entries;
    std::error_code ec = listDirectory(dir, entries);
    if (ec && entries.empty()) {
        stats.accessible = false;
        addWarning(dir, ec.message());
        cache_[dir.string()] = stats;
        return stats;
    }
    if (ec) {
        addWarning(dir, "enumeration stopped: " + ec.message());
    }

    for (const auto& entry : entries) {
        std::error_code entryEc;
        if (entry.is_directory(entryEc) && !entry.is_symlink(entryEc)) {
            if (isExcludedDirectory(entry.path())) {
                continue;
            }
            DirectoryProfile child = profileDirectory(entry.path());
            if (child.accessible) {
                stats.size += child.size;
                stats.files += child.files;
            }
        } else {
            auto size = entry.is_regular_file(entryEc) ? entry.file_size(entryEc) : 0;
            stats.size += entryEc ? 0 : static_cast<int64_t>(size);
            stats.files++;
        }
    }

    cache_[dir.string()] = stats;
    return stats;
}

void ChunkPlanner::planDirectory(const fs::path& dir, int depth, ChunkPlan& plan) {
    DirectoryProfile stats = profileDirectory(dir);
    if (!stats.accessible) {
        return;
    }

    if (fitsInChunk(stats) || depth >= profile_.chunkMaxDepth) {
        emitChunk(dir, stats, false, plan);
        return;
    }

    std::vector<fs::path> subdirectories;
    DirectoryProfile directFiles;

    // Enumeration errors were already reported while profiling
    std::vector<fs::directory_entry> entries;
    std::error_code ec = listDirectory(dir, entries);
    for (const auto& entry : entries) {
        std::error_code entryEc;
        if (entry.is_directory(entryEc) && !entry.is_symlink(entryEc)) {
            if (!isExcludedDirectory(entry.path())) {
                subdirectories.push_back(entry.path());
            }
        } else {
            auto size = entry.is_regular_file(entryEc) ? entry.file_size(entryEc) : 0;
            directFiles.size += entryEc ? 0 : static_cast<int64_t>(size);
            directFiles.files++;
        }
    }
    if (ec) {
        Logger::debug("Planning " + dir.string() + " from a partial listing: " + ec.message());
    }

    // Deterministic chunk order regardless of directory iteration order
    std::sort(subdirectories.begin(), subdirectories.end());
    for (const auto& subdirectory : subdirectories) {
        planDirectory(subdirectory, depth + 1, plan);
    }

    if (directFiles.files > 0) {
        emitChunk(dir, directFiles, true, plan);
    }
}

void ChunkPlanner::emitChunk(const fs::path& dir, const DirectoryProfile& stats, bool filesOnly,
                             ChunkPlan& plan) {
    Chunk chunk;
    chunk.chunkId = nextChunkId_++;
    chunk.sourcePath = dir.string();
    chunk.destinationPath = destinationFor(dir).string();
    chunk.copyArgs = buildCopyArgs(filesOnly);
    chunk.estimatedSize = stats.size;
    chunk.estimatedFiles = stats.files;
    chunk.filesOnly = filesOnly;

    if (stats.size > profile_.chunkMaxSizeBytes || stats.files > profile_.chunkMaxFiles) {
        Logger::debug("Chunk " + std::to_string(chunk.chunkId) + " exceeds configured limits: "
                      + chunk.sourcePath);
    }
    plan.chunks.push_back(std::move(chunk));
}

std::error_code ChunkPlanner::listDirectory(const fs::path& dir, std::vector<fs::directory_entry>& entries) {
    entries.clear();
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(*it);
    }
    return ec;
}

bool ChunkPlanner::fitsInChunk(const DirectoryProfile& stats) const {
    return stats.files <= profile_.chunkMaxFiles && stats.size <= profile_.chunkMaxSizeBytes;
}

bool ChunkPlanner::isExcludedDirectory(const fs::path& dir) const {
    std::string name = dir.filename().string();
    for (const auto& pattern : profile_.copyOptions.excludeDirs) {
        if (fnmatch(pattern.c_str(), name.c_str(), FNM_CASEFOLD) == 0
            || utils::equalsIgnoreCase(pattern, dir.string())) {
            return true;
        }
    }
    return false;
}

void ChunkPlanner::addWarning(const fs::path& path, const std::string& reason) {
    Logger::warning("Skipping inaccessible path " + path.string() + ": " + reason);
    warnings_.push_back(PlanningWarning{path.string(), reason});
}

fs::path ChunkPlanner::destinationFor(const fs::path& dir) const {
    fs::path relative = dir.lexically_relative(sourceRoot_);
    fs::path destination(profile_.destination);
    if (relative.empty() || relative == ".") {
        return destination;
    }
    return destination / relative;
}

std::vector<std::string> ChunkPlanner::buildCopyArgs(bool filesOnly) const {
    std::vector<std::string> args(profile_.copyOptions.switches);
    if (!profile_.copyOptions.excludeFiles.empty()) {
        args.push_back("/XF");
        args.insert(args.end(), profile_.copyOptions.excludeFiles.begin(),
                    profile_.copyOptions.excludeFiles.end());
    }
    if (!profile_.copyOptions.excludeDirs.empty()) {
        args.push_back("/XD");
        args.insert(args.end(), profile_.copyOptions.excludeDirs.begin(),
                    profile_.copyOptions.excludeDirs.end());
    }
    if (filesOnly) {
        args.push_back("/LEV:1");
    }
    return args;
}
