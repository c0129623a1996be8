#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed-size pool of worker threads draining a FIFO task queue.
// Tasks may submit further tasks. wait_idle() returns once the queue is
// empty and no task is running.

class WorkerPool {
public:
    /**
     * @brief Start the workers
     * @param threads Number of workers (clamped to at least 1)
     */
    explicit WorkerPool(size_t threads);

    /// Stops accepting work, drains the queue and joins all workers.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task
     * @param task Callable run on a worker thread
     * @return false if the pool is shutting down and the task was dropped
     */
    bool submit(std::function<void()> task);

    /**
     * @brief Block until the queue is empty and all workers are idle
     */
    void wait_idle();

    /**
     * @brief Stop accepting tasks, finish queued ones and join the workers
     */
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable task_cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    bool stopping_ = false;
};
