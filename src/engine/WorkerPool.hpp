#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace portsweep::engine {

/**
 * @brief Fixed-size pool of worker threads draining one shared task index.
 *
 * Tasks are numbered 0..taskCount-1. Each worker repeatedly claims the next
 * unclaimed index with an atomic increment, so every task runs exactly once
 * and no more than threadCount tasks run at the same time. A task that
 * throws is logged and counted as finished; it never stops the pool.
 *
 * @note This class is non-copyable. One instance serves one pipeline phase.
 */
class WorkerPool {
public:
    using Task = std::function<void(std::size_t index)>;

    /**
     * @brief Constructs a pool with the specified number of threads.
     * @param threadCount Maximum concurrent workers (clamped to at least 1).
     * @param name Phase name used in log messages.
     */
    explicit WorkerPool(std::size_t threadCount, std::string name = "pool");

    /**
     * @brief Destructor. Joins any worker still running.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Runs taskCount tasks and blocks until all of them have finished.
     *
     * Spawns min(threadCount, taskCount) threads; with zero tasks no thread
     * is started.
     *
     * @param taskCount Number of task indices to execute.
     * @param task Callable invoked once per index, from worker threads.
     */
    void run(std::size_t taskCount, const Task& task);

    /**
     * @brief Returns the configured maximum number of workers.
     */
    std::size_t threadCount() const { return threadCount_; }


private:
    void startWorker(std::size_t id, std::size_t taskCount, const Task& task);
    void join();

    std::vector<std::thread> threads_;
    std::atomic<std::size_t> nextIndex_{0};
    std::atomic<bool> running_{false};
    std::size_t threadCount_;
    std::string name_;
};

} // namespace portsweep::engine
