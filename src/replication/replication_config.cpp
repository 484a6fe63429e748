#include "replication/replication_config.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr int64_t kBytesPerGB = 1024LL * 1024 * 1024;

template<typename T>
void readField(const json& object, const char* key, T& value) {
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        value = it->template get<T>();
    }
}

void readSnapshotSettings(const json& object, const char* key, SnapshotSettings& settings) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return;
    }
    readField(*it, "Enabled", settings.enabled);
    readField(*it, "RetentionCount", settings.retentionCount);
}

SyncProfile parseProfile(const json& object) {
    SyncProfile profile;
    readField(object, "Name", profile.name);
    readField(object, "Source", profile.source);
    readField(object, "Destination", profile.destination);
    readField(object, "Enabled", profile.enabled);
    readField(object, "ChunkMaxDepth", profile.chunkMaxDepth);
    readField(object, "ChunkMaxFiles", profile.chunkMaxFiles);
    readField(object, "UseTemporarySnapshot", profile.useTemporarySnapshot);

    if (object.contains("ChunkMaxSizeGB")) {
        double sizeGB = object.at("ChunkMaxSizeGB").get<double>();
        profile.chunkMaxSizeBytes = static_cast<int64_t>(sizeGB * static_cast<double>(kBytesPerGB));
    }

    std::string scanMode;
    readField(object, "ScanMode", scanMode);
    if (!scanMode.empty() && !parseScanMode(scanMode, profile.scanMode)) {
        throw std::invalid_argument("Unknown ScanMode '" + scanMode + "' in profile '" + profile.name + "'");
    }

    auto options = object.find("RobocopyOptions");
    if (options != object.end() && options->is_object()) {
        readField(*options, "Switches", profile.copyOptions.switches);
        readField(*options, "ExcludeFiles", profile.copyOptions.excludeFiles);
        readField(*options, "ExcludeDirs", profile.copyOptions.excludeDirs);
    }

    readSnapshotSettings(object, "SourceSnapshot", profile.sourceSnapshot);
    readSnapshotSettings(object, "DestinationSnapshot", profile.destinationSnapshot);
    return profile;
}

} // namespace

std::string ReplicationConfig::snapshotRegistryPath() const {
    std::string base = configPath.empty() ? std::string("robocurse.json") : configPath;
    return std::filesystem::path(base).replace_extension(".snapshots.json").string();
}

std::string ReplicationConfig::snapshotTrackingPath() const {
    std::string base = configPath.empty() ? std::string("robocurse.json") : configPath;
    return std::filesystem::path(base).replace_extension(".tracking.json").string();
}

bool parseScanMode(const std::string& text, ScanMode& mode) {
    std::string lower = utils::toLower(text);
    if (lower == "flat") {
        mode = ScanMode::Flat;
        return true;
    }
    if (lower == "smart") {
        mode = ScanMode::Smart;
        return true;
    }
    return false;
}

OperationResult parseConfig(const std::string& text, ReplicationConfig& config) {
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            return OperationResult::failure(ErrorKind::ValidationError, "Configuration root must be an object");
        }

        auto settings = root.find("GlobalSettings");
        if (settings != root.end() && settings->is_object()) {
            GlobalSettings& global = config.settings;
            readField(*settings, "MaxConcurrentJobs", global.maxConcurrentJobs);
            readField(*settings, "RetryCount", global.retryCount);
            readField(*settings, "RetryDelaySeconds", global.retryDelaySeconds);
            readField(*settings, "ChunkTimeoutMinutes", global.chunkTimeoutMinutes);
            readField(*settings, "LogPath", global.logPath);
            readField(*settings, "LockDirectory", global.lockDirectory);
            readField(*settings, "CopyToolPath", global.copyToolPath);
            readField(*settings, "DryRun", global.dryRun);
        }

        config.profiles.clear();
        auto profiles = root.find("SyncProfiles");
        if (profiles != root.end()) {
            if (!profiles->is_array()) {
                return OperationResult::failure(ErrorKind::ValidationError, "SyncProfiles must be an array");
            }
            for (const auto& entry : *profiles) {
                config.profiles.push_back(parseProfile(entry));
            }
        }

        if (config.settings.maxConcurrentJobs < 1) {
            return OperationResult::failure(ErrorKind::ValidationError, "MaxConcurrentJobs must be at least 1");
        }
        if (config.settings.retryCount < 1) {
            return OperationResult::failure(ErrorKind::ValidationError, "RetryCount must be at least 1");
        }
        return OperationResult::ok();
    } catch (const json::exception& e) {
        return OperationResult::failure(ErrorKind::ValidationError, "Invalid configuration", e.what());
    } catch (const std::invalid_argument& e) {
        return OperationResult::failure(ErrorKind::ValidationError, e.what());
    }
}

OperationResult loadConfig(const std::string& path, ReplicationConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return OperationResult::failure(ErrorKind::ValidationError, "Cannot open configuration file " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    config.configPath = path;

    OperationResult result = parseConfig(buffer.str(), config);
    if (result) {
        Logger::info("Loaded " + std::to_string(config.profiles.size()) + " profile(s) from " + path);
    }
    return result;
}

OperationResult validateProfile(const SyncProfile& profile) {
    if (profile.name.empty()) {
        return OperationResult::failure(ErrorKind::ValidationError, "Profile name is empty");
    }
    if (profile.source.empty()) {
        return OperationResult::failure(ErrorKind::ValidationError,
                                        "Profile '" + profile.name + "' has no source path");
    }
    if (profile.destination.empty()) {
        return OperationResult::failure(ErrorKind::ValidationError,
                                        "Profile '" + profile.name + "' has no destination path");
    }
    if (profile.chunkMaxDepth < 0 || profile.chunkMaxFiles < 1 || profile.chunkMaxSizeBytes < 1) {
        return OperationResult::failure(ErrorKind::ValidationError,
                                        "Profile '" + profile.name + "' has invalid chunk limits");
    }
    if (profile.sourceSnapshot.enabled && profile.sourceSnapshot.retentionCount < 1) {
        return OperationResult::failure(ErrorKind::ValidationError,
                                        "Profile '" + profile.name + "' source snapshot retention must be at least 1");
    }
    if (profile.destinationSnapshot.enabled && profile.destinationSnapshot.retentionCount < 1) {
        return OperationResult::failure(ErrorKind::ValidationError,
                                        "Profile '" + profile.name + "' destination snapshot retention must be at least 1");
    }
    if (utils::isPathWithin(profile.destination, profile.source)
        || utils::isPathWithin(profile.source, profile.destination)) {
        return OperationResult::failure(ErrorKind::ValidationError,
                                        "Profile '" + profile.name + "' source and destination overlap",
                                        profile.source + " <-> " + profile.destination);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(profile.source, ec)) {
        return OperationResult::failure(ErrorKind::ValidationError,
                                        "Source path is not an accessible directory: " + profile.source,
                                        ec ? ec.message() : "");
    }
    return OperationResult::ok();
}
