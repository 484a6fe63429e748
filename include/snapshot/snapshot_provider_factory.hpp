#pragma once

#include "snapshot/snapshot_provider.hpp"
#include <memory>
#include <string>

class SnapshotTracker;

// Remote provider for "host:/path" and "//host/path", local LVM otherwise
std::unique_ptr<SnapshotProvider> createSnapshotProvider(const std::string& path,
                                                         SnapshotTracker* tracker = nullptr);
