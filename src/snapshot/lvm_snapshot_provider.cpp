#include "snapshot/lvm_snapshot_provider.hpp"
#include "snapshot/snapshot_tracker.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

static std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

static std::vector<std::string> splitFields(const std::string& line, char separator) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, separator)) {
        fields.push_back(trim(field));
    }
    return fields;
}

LvmSnapshotProvider::LvmSnapshotProvider(SnapshotTracker* tracker)
    : tracker_(tracker) {
}

std::string LvmSnapshotProvider::getServerName() const {
    return "Local";
}

std::string LvmSnapshotProvider::resolveVolume(const std::string& path) {
    return utils::volumeForPath(path);
}

std::string LvmSnapshotProvider::deviceForVolume(const std::string& volume) const {
    return volume;
}

int LvmSnapshotProvider::execute(const std::string& command, std::string& output) {
    Logger::debug("Executing: " + command);
    return utils::runCommand(command + " 2>&1", output);
}

bool LvmSnapshotProvider::lookupLogicalVolume(const std::string& device, std::string& vgName,
                                              std::string& lvName, std::string& error) {
    std::string output;
    std::string cmd = "lvs --noheadings --separator '|' -o vg_name,lv_name " + utils::shellQuote(device);
    int status = execute(cmd, output);
    if (status != 0) {
        error = trim(output);
        return false;
    }

    std::vector<std::string> fields = splitFields(trim(output), '|');
    if (fields.size() < 2 || fields[0].empty() || fields[1].empty()) {
        error = device + " is not a logical volume";
        return false;
    }
    vgName = fields[0];
    lvName = fields[1];
    return true;
}

OperationResult LvmSnapshotProvider::listSnapshots(const std::string& volume, std::vector<Snapshot>& snapshots) {
    snapshots.clear();

    std::string vgName;
    std::string lvName;
    std::string error;
    if (!lookupLogicalVolume(deviceForVolume(volume), vgName, lvName, error)) {
        return OperationResult::failure(ErrorKind::SnapshotError, "Cannot list snapshots of " + volume, error);
    }

    std::string output;
    std::string cmd = "lvs --noheadings --separator '|' -o lv_name,origin,lv_time " + utils::shellQuote(vgName);
    if (execute(cmd, output) != 0) {
        return OperationResult::failure(ErrorKind::SnapshotError, "Cannot list snapshots of " + volume, trim(output));
    }

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::vector<std::string> fields = splitFields(line, '|');
        if (fields.size() < 3 || fields[1] != lvName) {
            continue;
        }
        // Snapshots of the origin not created by us are still listed; the
        // registry decides which ones retention may touch
        Snapshot snapshot;
        snapshot.shadowId = vgName + "/" + fields[0];
        snapshot.sourceVolume = volume;
        snapshot.serverName = getServerName();
        if (!parseLvTime(fields[2], snapshot.createdAt)) {
            Logger::warning("Unparseable creation time '" + fields[2] + "' for snapshot " + snapshot.shadowId);
        }
        snapshots.push_back(snapshot);
    }
    return OperationResult::ok();
}

OperationResult LvmSnapshotProvider::createSnapshot(const std::string& sourcePath, bool skipTracking,
                                                    Snapshot& snapshot) {
    std::string volume = resolveVolume(sourcePath);
    std::string vgName;
    std::string lvName;
    std::string error;
    if (!lookupLogicalVolume(deviceForVolume(volume), vgName, lvName, error)) {
        return OperationResult::failure(ErrorKind::SnapshotError,
                                        "Cannot snapshot " + sourcePath + ": volume " + volume + " is not LVM", error);
    }

    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm utcTm{};
    gmtime_r(&tt, &utcTm);
    std::stringstream name;
    name << lvName << kNameTag << std::put_time(&utcTm, "%Y%m%d%H%M%S")
         << std::setw(3) << std::setfill('0') << millis;

    std::string output;
    std::string cmd = "lvcreate -s -n " + utils::shellQuote(name.str()) + " -l 100%ORIGIN "
                    + utils::shellQuote(vgName + "/" + lvName);
    if (execute(cmd, output) != 0) {
        Logger::error("Failed to create LVM snapshot of " + volume);
        return OperationResult::failure(ErrorKind::SnapshotError, "Failed to create snapshot of " + volume,
                                        trim(output));
    }

    snapshot = Snapshot{};
    snapshot.shadowId = vgName + "/" + name.str();
    snapshot.sourceVolume = volume;
    snapshot.createdAt = now;
    snapshot.serverName = getServerName();
    Logger::info("Created snapshot " + snapshot.shadowId + " of " + volume + " on " + snapshot.serverName);

    if (!skipTracking && tracker_) {
        OperationResult tracked = tracker_->track(snapshot);
        if (!tracked) {
            Logger::warning("Snapshot " + snapshot.shadowId + " is not tracked for cleanup: " + tracked.describe());
        }
    }
    return OperationResult::ok();
}

OperationResult LvmSnapshotProvider::deleteSnapshot(const std::string& shadowId) {
    if (shadowId.find('/') == std::string::npos) {
        return OperationResult::failure(ErrorKind::SnapshotError, "Invalid snapshot id '" + shadowId + "'");
    }

    std::string output;
    if (execute("lvremove -f " + utils::shellQuote(shadowId), output) != 0) {
        Logger::error("Failed to remove LVM snapshot " + shadowId);
        return OperationResult::failure(ErrorKind::SnapshotError, "Failed to delete snapshot " + shadowId,
                                        trim(output));
    }
    Logger::info("Deleted snapshot " + shadowId + " on " + getServerName());
    return OperationResult::ok();
}

OperationResult LvmSnapshotProvider::exposeSnapshot(Snapshot& snapshot, const std::string& mountPoint) {
    std::error_code ec;
    std::filesystem::create_directories(mountPoint, ec);
    if (ec) {
        return OperationResult::failure(ErrorKind::SnapshotError, "Cannot create mount point " + mountPoint,
                                        ec.message());
    }

    std::string output;
    std::string cmd = "mount -o ro " + utils::shellQuote("/dev/" + snapshot.shadowId) + " "
                    + utils::shellQuote(mountPoint);
    if (execute(cmd, output) != 0) {
        return OperationResult::failure(ErrorKind::SnapshotError,
                                        "Failed to mount snapshot " + snapshot.shadowId, trim(output));
    }
    snapshot.exposedPath = mountPoint;
    return OperationResult::ok();
}

OperationResult LvmSnapshotProvider::unexposeSnapshot(Snapshot& snapshot) {
    if (snapshot.exposedPath.empty()) {
        return OperationResult::ok();
    }

    std::string output;
    if (execute("umount " + utils::shellQuote(snapshot.exposedPath), output) != 0) {
        return OperationResult::failure(ErrorKind::SnapshotError,
                                        "Failed to unmount " + snapshot.exposedPath, trim(output));
    }
    std::error_code ec;
    std::filesystem::remove(snapshot.exposedPath, ec);
    snapshot.exposedPath.clear();
    return OperationResult::ok();
}

bool LvmSnapshotProvider::parseLvTime(const std::string& text, std::chrono::system_clock::time_point& time) {
    std::tm tm{};
    std::istringstream ss(trim(text));
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        return false;
    }

    long offsetSeconds = 0;
    std::string zone;
    if (ss >> zone && zone.size() == 5 && (zone[0] == '+' || zone[0] == '-')) {
        try {
            int hours = std::stoi(zone.substr(1, 2));
            int minutes = std::stoi(zone.substr(3, 2));
            offsetSeconds = (hours * 3600L + minutes * 60L) * (zone[0] == '-' ? -1 : 1);
        } catch (const std::exception&) {
            return false;
        }
    }

    time = std::chrono::system_clock::from_time_t(timegm(&tm) - offsetSeconds);
    return true;
}
