#pragma once

#include <string>
#include <vector>

struct CommandLineOptions {
    std::string configPath;
    std::vector<std::string> profiles;
    bool dryRun{false};
    bool resume{false};
    std::string logLevel{"INFO"};
};

// Print the replication command usage information
void printReplicateUsage();

// Parses the replication options. Returns false and sets error on bad input.
bool parseCommandLine(int argc, char* argv[], CommandLineOptions& options, std::string& error);

// Main entry point: loads the configuration and runs the selected profiles.
// Returns 0 on success, 1 on failure and 2 when the run was stopped.
int replicateMain(int argc, char* argv[]);
