#include "replication/orchestration_state.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <openssl/rand.h>

const char* phaseToString(Phase phase) {
    switch (phase) {
        case Phase::Idle:        return "Idle";
        case Phase::Profiling:   return "Profiling";
        case Phase::Chunking:    return "Chunking";
        case Phase::Replicating: return "Replicating";
        case Phase::Complete:    return "Complete";
        case Phase::Stopped:     return "Stopped";
        default:                 return "Unknown";
    }
}

OrchestrationState::OrchestrationState() {
    reset();
}

void OrchestrationState::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = Phase::Idle;
    sessionId_ = generateSessionId();
    currentProfile_.clear();
    profileIndex_ = -1;
    profileTotalChunks_ = 0;
    completedChunks_.clear();
    failedChunks_.clear();
    carriedOverPaths_.clear();
    completedCount_ = 0;
    failedCount_ = 0;
    activeCount_ = 0;
    skippedCount_ = 0;
    stopRequested_ = false;
    pauseRequested_ = false;
    startTime_ = std::chrono::system_clock::now();
}

bool OrchestrationState::isValidTransition(Phase from, Phase to) {
    if (from == Phase::Complete || from == Phase::Stopped) {
        return false;
    }
    if (to == Phase::Complete || to == Phase::Stopped) {
        return true;
    }

    switch (from) {
        case Phase::Idle:
            return to == Phase::Profiling;
        case Phase::Profiling:
            return to == Phase::Profiling || to == Phase::Chunking;
        case Phase::Chunking:
            return to == Phase::Replicating || to == Phase::Profiling;
        case Phase::Replicating:
            return to == Phase::Profiling;
        default:
            return false;
    }
}

bool OrchestrationState::transitionTo(Phase next) {
    Phase previous;
    PhaseCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = phase_;
        if (!isValidTransition(previous, next)) {
            Logger::warning(std::string("Rejected phase transition ") + phaseToString(previous)
                            + " -> " + phaseToString(next));
            return false;
        }
        phase_ = next;
        callback = phaseCallback_;
    }

    // Terminal phases release anyone parked on the pause flag
    if (next == Phase::Complete || next == Phase::Stopped) {
        pauseCondition_.notify_all();
    }

    Logger::debug(std::string("Phase ") + phaseToString(previous) + " -> " + phaseToString(next));
    if (callback) {
        callback(previous, next);
    }
    return true;
}

Phase OrchestrationState::getPhase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

bool OrchestrationState::isTerminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == Phase::Complete || phase_ == Phase::Stopped;
}

void OrchestrationState::beginProfile(const std::string& name, int index) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentProfile_ = name;
    profileIndex_ = index;
    profileTotalChunks_ = 0;
}

void OrchestrationState::setProfileTotalChunks(int total) {
    std::lock_guard<std::mutex> lock(mutex_);
    profileTotalChunks_ = total;
}

void OrchestrationState::chunkStarted() {
    std::lock_guard<std::mutex> lock(mutex_);
    activeCount_++;
}

void OrchestrationState::chunkCompleted(const Chunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeCount_ > 0) {
        activeCount_--;
    }
    completedChunks_.push_back(chunk);
    completedCount_++;
}

void OrchestrationState::chunkFailed(const Chunk& chunk, const std::string& cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeCount_ > 0) {
        activeCount_--;
    }
    failedChunks_.push_back(FailedChunk{chunk, cause});
    failedCount_++;
}

void OrchestrationState::chunkRequeued() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeCount_ > 0) {
        activeCount_--;
    }
}

void OrchestrationState::chunkSkipped(const Chunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    skippedCount_++;
    Logger::debug("Skipping chunk " + std::to_string(chunk.chunkId) + " completed by an earlier run: "
                  + chunk.sourcePath);
}

void OrchestrationState::setCarriedOverPaths(const std::vector<std::string>& paths) {
    std::lock_guard<std::mutex> lock(mutex_);
    carriedOverPaths_.clear();
    for (const auto& path : paths) {
        if (!path.empty()) {
            carriedOverPaths_.push_back(path);
        }
    }
}

void OrchestrationState::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    pauseCondition_.notify_all();
    Logger::info("Stop requested, in-flight chunks will drain");
}

void OrchestrationState::requestPause() {
    std::lock_guard<std::mutex> lock(mutex_);
    pauseRequested_ = true;
}

void OrchestrationState::requestResume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pauseRequested_ = false;
    }
    pauseCondition_.notify_all();
}

bool OrchestrationState::isStopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopRequested_;
}

bool OrchestrationState::isPauseRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pauseRequested_;
}

bool OrchestrationState::waitWhilePaused(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return pauseCondition_.wait_for(lock, timeout, [this] {
        return !pauseRequested_ || stopRequested_;
    });
}

std::vector<Chunk> OrchestrationState::getCompletedChunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completedChunks_;
}

std::vector<FailedChunk> OrchestrationState::getFailedChunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failedChunks_;
}

std::vector<std::string> OrchestrationState::getCheckpointPaths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> paths;
    paths.reserve(completedChunks_.size() + carriedOverPaths_.size());
    for (const auto& chunk : completedChunks_) {
        paths.push_back(chunk.sourcePath);
    }
    for (const auto& path : carriedOverPaths_) {
        bool present = std::any_of(completedChunks_.begin(), completedChunks_.end(),
                                   [&path](const Chunk& chunk) {
                                       return utils::equalsIgnoreCase(chunk.sourcePath, path);
                                   });
        if (!present) {
            paths.push_back(path);
        }
    }
    return paths;
}

std::string OrchestrationState::getSessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessionId_;
}

StateSnapshot OrchestrationState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StateSnapshot copy;
    copy.phase = phase_;
    copy.sessionId = sessionId_;
    copy.currentProfile = currentProfile_;
    copy.profileIndex = profileIndex_;
    copy.profileTotalChunks = profileTotalChunks_;
    copy.completedCount = completedCount_;
    copy.failedCount = failedCount_;
    copy.activeCount = activeCount_;
    copy.skippedCount = skippedCount_;
    copy.stopRequested = stopRequested_;
    copy.pauseRequested = pauseRequested_;
    copy.startTime = startTime_;
    return copy;
}

void OrchestrationState::setPhaseCallback(PhaseCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    phaseCallback_ = std::move(callback);
}

std::string OrchestrationState::generateSessionId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);
        for (auto& byte : bytes) {
            byte = static_cast<unsigned char>(dis(gen));
        }
    }

    // RFC 4122 version 4 layout
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::stringstream ss;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return ss.str();
}
