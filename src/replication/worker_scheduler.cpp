#include "replication/worker_scheduler.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>

WorkerScheduler::WorkerScheduler(OrchestrationState& state,
                                 CopyTool& copyTool,
                                 CheckpointManager& checkpointManager,
                                 const SchedulerSettings& settings)
    : state_(state)
    , copyTool_(copyTool)
    , checkpointManager_(checkpointManager)
    , settings_(settings) {
    if (settings_.maxConcurrentJobs < 1) {
        settings_.maxConcurrentJobs = 1;
    }
    if (settings_.retryCount < 1) {
        settings_.retryCount = 1;
    }
}

ScheduleResult WorkerScheduler::run(const std::vector<Chunk>& chunks, const std::optional<Checkpoint>& resumeFrom) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
        inFlight_ = 0;
        result_ = ScheduleResult();
        result_.planned = chunks.size();

        auto now = std::chrono::steady_clock::now();
        for (const auto& chunk : chunks) {
            if (CheckpointManager::isChunkCompleted(chunk, resumeFrom)) {
                state_.chunkSkipped(chunk);
                result_.skipped++;
                continue;
            }
            pending_.push_back(PendingChunk{chunk, 0, now});
        }
    }
    state_.setProfileTotalChunks(static_cast<int>(chunks.size()));

    if (result_.skipped > 0) {
        Logger::info("Resuming profile '" + settings_.profileName + "': skipping "
                     + std::to_string(result_.skipped) + " of " + std::to_string(chunks.size())
                     + " chunk(s) already completed");
    }

    ParallelTaskManager pool(static_cast<size_t>(settings_.maxConcurrentJobs));

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        // Stop and fatal are observed between dispatches only
        if (result_.fatal || state_.isStopRequested() || state_.isTerminal()) {
            break;
        }

        if (state_.isPauseRequested()) {
            lock.unlock();
            state_.waitWhilePaused(settings_.pollInterval);
            lock.lock();
            continue;
        }

        if (pending_.empty() && inFlight_ == 0) {
            break;
        }

        if (!pending_.empty() && inFlight_ < static_cast<size_t>(settings_.maxConcurrentJobs)) {
            if (dispatchNext(lock, pool)) {
                continue;
            }
        }

        completion_.wait_for(lock, settings_.pollInterval);
    }

    if (inFlight_ > 0) {
        Logger::info("Waiting for " + std::to_string(inFlight_) + " in-flight chunk(s) to finish");
    }
    completion_.wait(lock, [this] { return inFlight_ == 0; });

    if (!result_.fatal && state_.isStopRequested()) {
        result_.stopped = true;
        lock.unlock();
        state_.transitionTo(Phase::Stopped);
        lock.lock();
    }

    if (result_.fatal && !pending_.empty()) {
        Logger::error("Profile '" + settings_.profileName + "' aborted, " + std::to_string(pending_.size())
                      + " chunk(s) not dispatched");
    }
    pending_.clear();
    return result_;
}

bool WorkerScheduler::dispatchNext(std::unique_lock<std::mutex>& lock, ParallelTaskManager& pool) {
    auto now = std::chrono::steady_clock::now();
    auto ready = std::find_if(pending_.begin(), pending_.end(),
                              [now](const PendingChunk& item) { return item.notBefore <= now; });

    if (ready == pending_.end()) {
        // Only retries waiting out their delay remain
        auto earliest = std::min_element(pending_.begin(), pending_.end(),
                                         [](const PendingChunk& a, const PendingChunk& b) {
                                             return a.notBefore < b.notBefore;
                                         });
        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(earliest->notBefore - now);
        completion_.wait_for(lock, std::min(delay, settings_.pollInterval));
        return true;
    }

    PendingChunk item = *ready;
    pending_.erase(ready);
    inFlight_++;
    result_.dispatched++;

    lock.unlock();
    if (state_.getPhase() == Phase::Chunking) {
        state_.transitionTo(Phase::Replicating);
    }
    state_.chunkStarted();

    try {
        pool.addTask([this, item]() { executeChunk(item); });
    } catch (const std::exception& e) {
        Logger::error("Failed to dispatch chunk " + std::to_string(item.chunk.chunkId) + ": " + e.what());
        ExitClassification outcome;
        outcome.severity = ExitSeverity::Error;
        outcome.shouldRetry = true;
        outcome.message = e.what();
        finishChunk(item, item.attempts + 1, outcome);
    }
    lock.lock();
    return true;
}

void WorkerScheduler::executeChunk(const PendingChunk& item) {
    int attempt = item.attempts + 1;
    ExitClassification outcome;

    if (settings_.dryRun) {
        outcome.message = "Dry run, copy not started";
        Logger::info("[DRY RUN] Would copy " + item.chunk.sourcePath + " -> " + item.chunk.destinationPath);
        finishChunk(item, attempt, outcome);
        return;
    }

    try {
        auto handle = copyTool_.start(item.chunk, chunkLogPath(item.chunk, attempt));
        auto exitCode = copyTool_.wait(*handle, settings_.chunkTimeout);
        if (exitCode) {
            outcome = classifyExitCode(*exitCode);
        } else {
            copyTool_.terminate(*handle);
            outcome.severity = ExitSeverity::Error;
            outcome.shouldRetry = true;
            outcome.message = "Copy tool timed out after "
                + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(settings_.chunkTimeout).count())
                + "s";
        }
    } catch (const std::exception& e) {
        outcome.severity = ExitSeverity::Error;
        outcome.shouldRetry = true;
        outcome.message = std::string("Copy tool failed to run: ") + e.what();
    }

    finishChunk(item, attempt, outcome);
}

void WorkerScheduler::finishChunk(const PendingChunk& item, int attempt, const ExitClassification& outcome) {
    const Chunk& chunk = item.chunk;
    std::string label = "Chunk " + std::to_string(chunk.chunkId) + " (" + chunk.sourcePath + ")";
    Logger::debug(label + " attempt " + std::to_string(attempt) + " classified "
                  + exitSeverityToString(outcome.severity));

    switch (outcome.severity) {
        case ExitSeverity::Success:
        case ExitSeverity::Warning: {
            if (outcome.severity == ExitSeverity::Warning) {
                Logger::warning(label + " completed with warnings: " + outcome.message);
            } else {
                Logger::info(label + " completed: " + outcome.message);
            }
            state_.chunkCompleted(chunk);
            if (!settings_.dryRun) {
                OperationResult saved = checkpointManager_.save(&state_);
                if (!saved) {
                    Logger::warning("Checkpoint not updated: " + saved.describe());
                }
            }
            std::lock_guard<std::mutex> lock(mutex_);
            result_.completed++;
            break;
        }
        case ExitSeverity::Error: {
            if (outcome.shouldRetry && attempt < settings_.retryCount) {
                Logger::warning(label + " attempt " + std::to_string(attempt) + "/"
                                + std::to_string(settings_.retryCount) + " failed, will retry: " + outcome.message);
                state_.chunkRequeued();
                std::lock_guard<std::mutex> lock(mutex_);
                pending_.push_back(PendingChunk{chunk, attempt,
                                                std::chrono::steady_clock::now() + settings_.retryDelay});
                result_.retried++;
            } else {
                Logger::error(label + " failed after " + std::to_string(attempt) + " attempt(s): " + outcome.message);
                state_.chunkFailed(chunk, outcome.message);
                std::lock_guard<std::mutex> lock(mutex_);
                result_.failed++;
            }
            break;
        }
        case ExitSeverity::Fatal: {
            Logger::error(label + " hit a fatal error, aborting profile '" + settings_.profileName + "': "
                          + outcome.message);
            state_.chunkFailed(chunk, outcome.message);
            std::lock_guard<std::mutex> lock(mutex_);
            result_.failed++;
            if (!result_.fatal) {
                result_.fatal = true;
                result_.fatalMessage = label + ": " + outcome.message;
            }
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_--;
    }
    completion_.notify_all();
    reportProgress();
}

std::string WorkerScheduler::chunkLogPath(const Chunk& chunk, int attempt) const {
    std::string directory = settings_.logDirectory.empty() ? Logger::getLogDirectory() : settings_.logDirectory;
    if (directory.empty()) {
        directory = ".";
    }

    std::string name = utils::sanitizeName(settings_.profileName.empty() ? "profile" : settings_.profileName)
        + "_chunk_" + std::to_string(chunk.chunkId);
    if (attempt > 1) {
        name += "_attempt" + std::to_string(attempt);
    }
    return (std::filesystem::path(directory) / "chunks" / (name + ".log")).string();
}

void WorkerScheduler::reportProgress() {
    if (progressCallback_) {
        progressCallback_(state_.snapshot());
    }
}
