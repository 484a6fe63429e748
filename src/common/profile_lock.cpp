#include "common/profile_lock.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

ProfileLock::ProfileLock(const std::string& lockDirectory)
    : lockDirectory_(lockDirectory.empty() ? std::string("/tmp") : lockDirectory) {
}

ProfileLock::~ProfileLock() {
    releaseAll();
}

std::string ProfileLock::lockPathFor(const std::string& profileName) const {
    std::string sanitized = utils::sanitizeName(profileName);
    std::string digest = utils::sha256Hex(sanitized).substr(0, 8);
    return (std::filesystem::path(lockDirectory_) / ("robocurse-" + sanitized + "-" + digest + ".lock")).string();
}

std::string ProfileLock::defaultOwner() {
    return "pid:" + std::to_string(::getpid());
}

OperationResult ProfileLock::registerRun(const std::string& profileName, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = utils::sanitizeName(profileName);

    auto it = held_.find(key);
    if (it != held_.end()) {
        if (it->second.owner == owner) {
            return OperationResult::ok("Profile '" + profileName + "' already registered by " + owner);
        }
        return OperationResult::failure(ErrorKind::LockContentionError,
                                        "Profile '" + profileName + "' is already running",
                                        "held by " + it->second.owner);
    }

    std::error_code ec;
    std::filesystem::create_directories(lockDirectory_, ec);

    std::string path = lockPathFor(profileName);
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return OperationResult::failure(ErrorKind::LockContentionError,
                                        "Cannot open lock file " + path, std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return OperationResult::failure(ErrorKind::LockContentionError,
                                            "Profile '" + profileName + "' is already running",
                                            "lock held on " + path);
        }
        return OperationResult::failure(ErrorKind::LockContentionError,
                                        "flock failed on " + path, std::strerror(err));
    }

    std::string ownerLine = owner + "\n";
    if (::ftruncate(fd, 0) != 0
        || ::pwrite(fd, ownerLine.data(), ownerLine.size(), 0) != static_cast<ssize_t>(ownerLine.size())) {
        Logger::warning("Could not record owner in lock file " + path + ": " + std::strerror(errno));
    }

    held_[key] = HeldLock{fd, owner};
    Logger::debug("Acquired profile lock " + path + " for " + owner);
    return OperationResult::ok();
}

bool ProfileLock::unregisterRun(const std::string& profileName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(utils::sanitizeName(profileName));
    if (it == held_.end()) {
        return false;
    }

    ::flock(it->second.fd, LOCK_UN);
    ::close(it->second.fd);
    held_.erase(it);
    Logger::debug("Released profile lock for '" + profileName + "'");
    return true;
}

bool ProfileLock::isRunning(const std::string& profileName) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (held_.count(utils::sanitizeName(profileName)) > 0) {
            return true;
        }
    }

    std::string path = lockPathFor(profileName);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }

    bool running = false;
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        running = (errno == EWOULDBLOCK);
    } else {
        ::flock(fd, LOCK_UN);
    }
    ::close(fd);
    return running;
}

void ProfileLock::releaseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : held_) {
        ::flock(entry.second.fd, LOCK_UN);
        ::close(entry.second.fd);
    }
    held_.clear();
}
