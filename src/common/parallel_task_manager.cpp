#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>

ParallelTaskManager::ParallelTaskManager(size_t numThreads)
    : stop_(false)
    , activeTasks_(0) {
    if (numThreads == 0) {
        numThreads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
}

ParallelTaskManager::~ParallelTaskManager() {
    waitForAll();
    stop();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ParallelTaskManager::waitForAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

bool ParallelTaskManager::waitForAll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return idleCondition_.wait_for(lock, timeout, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

void ParallelTaskManager::stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

void ParallelTaskManager::workerThread() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++activeTasks_;
        }

        auto started = std::chrono::steady_clock::now();
        bool success = true;
        try {
            if (task.func) {
                task.func();
            }
        } catch (const std::exception& e) {
            // packaged_task stores its own exceptions; this only sees wrapper failures
            success = false;
            Logger::error("Worker task failed: " + std::string(e.what()));
        }
        updateStats(started, success);

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            if (tasks_.empty() && activeTasks_ == 0) {
                idleCondition_.notify_all();
            }
        }
    }
}

void ParallelTaskManager::updateStats(std::chrono::steady_clock::time_point started, bool success) {
    auto finished = std::chrono::steady_clock::now();
    double seconds = std::chrono::duration<double>(finished - started).count();

    std::lock_guard<std::mutex> lock(statsMutex_);
    if (stats_.currentQueueSize > 0) {
        stats_.currentQueueSize--;
    }
    if (success) {
        stats_.completedTasks++;
    } else {
        stats_.failedTasks++;
    }
    size_t finishedTasks = stats_.completedTasks + stats_.failedTasks;
    stats_.averageTaskTime += (seconds - stats_.averageTaskTime) / static_cast<double>(finishedTasks);
}

size_t ParallelTaskManager::getThreadCount() const {
    return workers_.size();
}

size_t ParallelTaskManager::getActiveTaskCount() const {
    return activeTasks_.load();
}

TaskStats ParallelTaskManager::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}
