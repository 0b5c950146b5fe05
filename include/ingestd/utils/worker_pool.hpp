/**
 * @file worker_pool.hpp
 * @brief Fixed set of owned threads draining a bounded task queue.
 *
 * Used wherever blocking work must leave the calling thread: request
 * handling in the service, and closing retired streams in a slot. The
 * pool joins every thread it started, so no task outlives its owner.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/utils/export.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ingestd {
namespace utils {

/**
 * @class WorkerPool
 * @brief Runs posted tasks on a fixed number of threads.
 *
 * Usage:
 * @code
 * WorkerPool pool("ingest", 4, 1024);
 * if (!pool.post([]() { doBlockingWork(); })) {
 *     // queue full or pool stopped
 * }
 * @endcode
 */
class INGESTD_UTILS_API WorkerPool {
public:
    /**
     * @brief Start the worker threads.
     * @param name Component name used in log lines.
     * @param threads Number of workers (at least one is started).
     * @param maxQueued Tasks allowed to wait for a worker (0 = unbounded).
     */
    WorkerPool(std::string name, size_t threads, size_t maxQueued);

    /**
     * @brief Stops the pool (see stop()).
     */
    ~WorkerPool();

    // Non-copyable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task.
     * @return False if the queue is full or the pool is stopped; the task
     *         is not run in that case.
     */
    bool post(std::function<void()> task);

    /**
     * @brief Refuse new tasks, run the ones already queued, join the workers.
     *
     * Idempotent. Called from one of the pool's own tasks, the calling
     * worker is detached instead of joined and exits once the queue is empty.
     */
    void stop();

    size_t threadCount() const { return threads_.size(); }

    size_t queued() const;

    bool isRunning() const;

private:
    // Shared with the workers so a detached worker never touches a dead pool
    struct Shared {
        std::string name;
        size_t maxQueued = 0;

        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::function<void()>> tasks;
        bool running = true;
    };

    static void workerLoop(std::shared_ptr<Shared> shared);

    std::shared_ptr<Shared> shared_;
    std::vector<std::thread> threads_;
};

}  // namespace utils
}  // namespace ingestd
