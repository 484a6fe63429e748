#pragma once

#include <string>
#include <vector>
#include <cstdint>

// One bounded unit of a profile's source tree, copied by a single copy-tool
// invocation. Immutable once planned.
struct Chunk {
    int chunkId{0};
    std::string sourcePath;
    std::string destinationPath;
    std::vector<std::string> copyArgs;
    int64_t estimatedSize{0};
    int64_t estimatedFiles{0};
    bool filesOnly{false};  // top-level files of sourcePath, not its subdirectories
};
