#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace utils {

// ASCII case folding; non-ASCII bytes are compared verbatim.
std::string toLower(const std::string& str);
bool equalsIgnoreCase(const std::string& a, const std::string& b);

// Replaces every character outside [A-Za-z0-9._-] with '_'.
std::string sanitizeName(const std::string& name);

// Volume identifier for a path: "D:" for drive-letter paths, "host:<volume>"
// for remote paths, otherwise the block device mounted under the path
// (from /proc/mounts), falling back to the mount point itself.
std::string volumeForPath(const std::string& path);

// Splits "host:/path" and "//host/path" forms. Returns false for local paths.
bool splitRemotePath(const std::string& path, std::string& host, std::string& remotePath);

// Longest /proc/mounts entry containing the path. Returns false if none matched.
bool findMountForPath(const std::string& path, std::string& device, std::string& mountPoint);

bool isPathWithin(const std::string& child, const std::string& parent);

std::string formatIso8601(std::chrono::system_clock::time_point time);
bool parseIso8601(const std::string& text, std::chrono::system_clock::time_point& time);

// Writes content to a temporary sibling, then renames it over the path.
bool writeFileAtomically(const std::string& path, const std::string& content, std::string& error);

std::string sha256Hex(const std::string& data);

// Quotes an argument for /bin/sh.
std::string shellQuote(const std::string& arg);

// Runs a shell command, capturing stdout. Returns the exit status or -1 if
// the command could not be started.
int runCommand(const std::string& command, std::string& output);

} // namespace utils
