#include "replication/checkpoint_manager.hpp"
#include "replication/orchestration_state.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Paths are stored with invalid UTF-8 sequences replaced by U+FFFD; this is
// the form such a path takes after a save and load.
std::string storedForm(const std::string& path) {
    try {
        std::string dumped = json(path).dump(-1, ' ', false, json::error_handler_t::replace);
        return json::parse(dumped).get<std::string>();
    } catch (const json::exception& e) {
        Logger::debug(std::string("Cannot normalize checkpoint path: ") + e.what());
        return path;
    }
}

} // namespace

CheckpointManager::CheckpointManager(const std::string& directory)
    : directory_(directory) {
}

std::string CheckpointManager::getCheckpointPath() const {
    std::string directory = directory_;
    if (directory.empty()) {
        directory = Logger::getLogDirectory();
    }
    if (directory.empty()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        directory = ec ? std::string(".") : cwd.string();
    }
    return (fs::path(directory) / kFileName).string();
}

void CheckpointManager::setDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(mutex_);
    directory_ = directory;
}

OperationResult CheckpointManager::save(const OrchestrationState* state) {
    if (!state) {
        return OperationResult::failure(ErrorKind::CheckpointError,
                                        "Cannot save checkpoint", "no orchestration state exists");
    }

    // State is read under the save lock: files land in snapshot order
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> paths = state->getCheckpointPaths();
    json document;
    document["Version"] = kVersion;
    document["SessionId"] = state->getSessionId();
    document["CompletedChunkPaths"] = paths;
    document["CompletedCount"] = paths.size();
    document["SavedAt"] = utils::formatIso8601(std::chrono::system_clock::now());

    std::string content;
    try {
        content = document.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return OperationResult::failure(ErrorKind::CheckpointError, "Failed to serialize checkpoint", e.what());
    }

    std::string path = getCheckpointPath();
    std::string error;
    if (!utils::writeFileAtomically(path, content, error)) {
        return OperationResult::failure(ErrorKind::CheckpointError, "Failed to save checkpoint " + path, error);
    }

    Logger::debug("Checkpoint saved: " + std::to_string(paths.size()) + " completed chunk(s)");
    return OperationResult::ok(path);
}

std::optional<Checkpoint> CheckpointManager::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string path = getCheckpointPath();

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        std::stringstream buffer;
        buffer << file.rdbuf();
        json document = json::parse(buffer.str());
        if (!document.is_object()) {
            Logger::warning("Ignoring checkpoint " + path + ": not a JSON object");
            return std::nullopt;
        }

        auto version = document.find("Version");
        if (version == document.end() || !version->is_string() || version->get<std::string>() != kVersion) {
            Logger::warning("Ignoring checkpoint " + path + ": version mismatch");
            return std::nullopt;
        }

        Checkpoint checkpoint;
        checkpoint.version = version->get<std::string>();
        if (document.contains("SessionId") && document["SessionId"].is_string()) {
            checkpoint.sessionId = document["SessionId"].get<std::string>();
        }
        if (document.contains("SavedAt") && document["SavedAt"].is_string()) {
            checkpoint.savedAt = document["SavedAt"].get<std::string>();
        }

        auto paths = document.find("CompletedChunkPaths");
        if (paths != document.end()) {
            if (!paths->is_array()) {
                Logger::warning("Ignoring checkpoint " + path + ": CompletedChunkPaths is not an array");
                return std::nullopt;
            }
            for (const auto& entry : *paths) {
                if (entry.is_string()) {
                    checkpoint.completedChunkPaths.push_back(entry.get<std::string>());
                }
            }
        }

        auto count = document.find("CompletedCount");
        checkpoint.completedCount = (count != document.end() && count->is_number_unsigned())
            ? count->get<size_t>()
            : checkpoint.completedChunkPaths.size();

        Logger::info("Loaded checkpoint from " + path + " with "
                     + std::to_string(checkpoint.completedChunkPaths.size()) + " completed chunk(s)");
        return checkpoint;
    } catch (const std::exception& e) {
        Logger::warning("Ignoring unreadable checkpoint " + path + ": " + e.what());
        return std::nullopt;
    }
}

bool CheckpointManager::remove(bool dryRun) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string path = getCheckpointPath();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }

    if (dryRun) {
        Logger::info("[DRY RUN] Would remove checkpoint " + path);
        return true;
    }

    if (!fs::remove(path, ec)) {
        Logger::warning("Failed to remove checkpoint " + path + ": " + ec.message());
        return false;
    }
    Logger::info("Removed checkpoint " + path);
    return true;
}

bool CheckpointManager::isChunkCompleted(const Chunk& chunk, const std::optional<Checkpoint>& checkpoint) {
    if (!checkpoint || checkpoint->completedChunkPaths.empty()) {
        return false;
    }
    if (chunk.sourcePath.empty()) {
        return false;
    }

    for (const auto& path : checkpoint->completedChunkPaths) {
        if (!path.empty() && utils::equalsIgnoreCase(path, chunk.sourcePath)) {
            return true;
        }
    }

    std::string stored = storedForm(chunk.sourcePath);
    if (stored == chunk.sourcePath) {
        return false;
    }
    for (const auto& path : checkpoint->completedChunkPaths) {
        if (!path.empty() && utils::equalsIgnoreCase(path, stored)) {
            return true;
        }
    }
    return false;
}
