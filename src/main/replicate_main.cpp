#include "main/replicate_main.hpp"
#include "replication/process_copy_tool.hpp"
#include "replication/replication_config.hpp"
#include "replication/replication_orchestrator.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

volatile std::sig_atomic_t stopSignal = 0;

void handleStopSignal(int signum) {
    stopSignal = signum;
}

void installSignalHandlers() {
    struct sigaction sa = {};
    sa.sa_handler = handleStopSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

void printReplicateUsage() {
    std::cout << "Usage: robocurse --config <file> [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file (JSON)\n"
              << "  -p, --profile <name>   Run only this profile (repeatable)\n"
              << "  -n, --dry-run          Plan and log without copying or snapshotting\n"
              << "  -r, --resume           Skip chunks recorded in the last checkpoint\n"
              << "  --log-level <level>    DEBUG, INFO, WARNING, ERROR or FATAL\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n";
}

bool parseCommandLine(int argc, char* argv[], CommandLineOptions& options, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                error = arg + " requires a file";
                return false;
            }
            options.configPath = argv[++i];
        } else if (arg == "-p" || arg == "--profile") {
            if (i + 1 >= argc) {
                error = arg + " requires a profile name";
                return false;
            }
            options.profiles.push_back(argv[++i]);
        } else if (arg == "-n" || arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "-r" || arg == "--resume") {
            options.resume = true;
        } else if (arg == "--log-level") {
            if (i + 1 >= argc) {
                error = arg + " requires a level";
                return false;
            }
            options.logLevel = argv[++i];
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }

    if (options.configPath.empty()) {
        error = "No configuration file specified";
        return false;
    }
    return true;
}

int replicateMain(int argc, char* argv[]) {
    CommandLineOptions options;
    std::string error;
    if (!parseCommandLine(argc, argv, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        printReplicateUsage();
        return 1;
    }

    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLevel(options.logLevel, level)) {
        std::cerr << "Error: Unknown log level: " << options.logLevel << std::endl;
        return 1;
    }

    ReplicationConfig config;
    OperationResult loaded = loadConfig(options.configPath, config);
    if (!loaded) {
        std::cerr << "Error: " << loaded.describe() << std::endl;
        return 1;
    }

    if (!Logger::initialize(config.settings.logPath, level)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }

    ProcessCopyTool copyTool(config.settings.copyToolPath);
    ReplicationOrchestrator orchestrator(config, copyTool);

    installSignalHandlers();
    std::atomic<bool> finished{false};
    std::thread signalWatcher([&orchestrator, &finished]() {
        while (!finished) {
            if (stopSignal != 0) {
                Logger::warning("Received signal " + std::to_string(stopSignal) + ", stopping after in-flight chunks");
                orchestrator.requestStop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    RunOptions runOptions;
    runOptions.profileNames = options.profiles;
    runOptions.dryRun = options.dryRun;
    runOptions.resume = options.resume;

    RunSummary summary;
    try {
        summary = orchestrator.run(runOptions);
    } catch (const std::exception& e) {
        finished = true;
        signalWatcher.join();
        Logger::error("Error in replication run: " + std::string(e.what()));
        Logger::shutdown();
        return 1;
    }
    finished = true;
    signalWatcher.join();

    for (const auto& profile : summary.profiles) {
        if (profile.result) {
            Logger::info(profile.name + ": " + profile.result.describe());
        } else {
            Logger::error(profile.name + ": " + profile.result.describe());
        }
    }

    int exitCode = summary.succeeded() ? 0 : (summary.stopped ? 2 : 1);
    Logger::shutdown();
    return exitCode;
}
