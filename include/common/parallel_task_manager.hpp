#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t currentQueueSize{0};
};

// Fixed-size worker pool draining a FIFO queue. Exceptions thrown by a task
// are delivered through its future.
class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    // Add a task to the queue
    template<typename F, typename... Args>
    auto addTask(F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    // Wait until the queue is empty and no task is running
    void waitForAll();

    size_t getThreadCount() const { return workers_.size(); }
    TaskStats getStats() const;

private:
    void workerThread();
    void stop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    bool stop_{false};
    size_t activeTasks_{0};
    TaskStats stats_;
};

template<typename F, typename... Args>
auto ParallelTaskManager::addTask(F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {

    using return_type = typename std::result_of<F(Args...)>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }

        tasks_.push([task]() { (*task)(); });
        stats_.totalTasks++;
        stats_.currentQueueSize++;
    }

    condition_.notify_one();
    return result;
}
