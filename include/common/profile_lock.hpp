#pragma once

#include "common/operation_result.hpp"
#include <string>
#include <map>
#include <mutex>

// Advisory duplicate-run guard. Each profile maps to a lock file whose name is
// derived from the sanitized profile name; the lock is an flock(2) on that
// file, so the kernel drops it when the holding process exits.
class ProfileLock {
public:
    explicit ProfileLock(const std::string& lockDirectory = "/tmp");
    ~ProfileLock();

    ProfileLock(const ProfileLock&) = delete;
    ProfileLock& operator=(const ProfileLock&) = delete;

    // Registering a profile already held by the same owner succeeds again.
    OperationResult registerRun(const std::string& profileName, const std::string& owner);
    bool unregisterRun(const std::string& profileName);
    bool isRunning(const std::string& profileName) const;
    void releaseAll();

    std::string lockPathFor(const std::string& profileName) const;
    static std::string defaultOwner();

private:
    struct HeldLock {
        int fd{-1};
        std::string owner;
    };

    std::string lockDirectory_;
    std::map<std::string, HeldLock> held_;
    mutable std::mutex mutex_;
};
