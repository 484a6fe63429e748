#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <type_traits>

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t failedTasks{0};
    double averageTaskTime{0.0};
    size_t currentQueueSize{0};
};

// Fixed-size worker pool. Tasks run in submission order; the pool never runs
// more than numThreads tasks at once.
class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    template<typename F>
    auto addTask(F&& f) -> std::future<std::invoke_result_t<F>>;

    // Blocks until the queue is empty and no task is running.
    void waitForAll();

    // Blocks until the queue is empty and no task is running, or the timeout
    // elapses. Returns true if the pool drained.
    bool waitForAll(std::chrono::milliseconds timeout);

    size_t getThreadCount() const;
    size_t getActiveTaskCount() const;
    TaskStats getStats() const;

private:
    struct Task {
        std::function<void()> func;
        std::chrono::steady_clock::time_point queuedTime;
    };

    void workerThread();
    void stop();
    void updateStats(std::chrono::steady_clock::time_point started, bool success);

    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idleCondition_;
    bool stop_;

    mutable std::mutex statsMutex_;
    TaskStats stats_;
    std::atomic<size_t> activeTasks_{0};
};

template<typename F>
auto ParallelTaskManager::addTask(F&& f) -> std::future<std::invoke_result_t<F>> {
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }
        tasks_.push(Task{[task]() { (*task)(); }, std::chrono::steady_clock::now()});
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.totalTasks++;
        stats_.currentQueueSize++;
    }

    condition_.notify_one();
    return result;
}
