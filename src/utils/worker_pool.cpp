/**
 * @file worker_pool.cpp
 * @brief WorkerPool thread management.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/utils/worker_pool.hpp"
#include "ingestd/utils/logger.hpp"

#include <exception>
#include <utility>

namespace ingestd {
namespace utils {

WorkerPool::WorkerPool(std::string name, size_t threads, size_t maxQueued)
    : shared_(std::make_shared<Shared>())
{
    shared_->name = std::move(name);
    shared_->maxQueued = maxQueued;
    if (threads == 0) {
        threads = 1;
    }

    threads_.reserve(threads);
    try {
        for (size_t i = 0; i < threads; ++i) {
            threads_.emplace_back(&WorkerPool::workerLoop, shared_);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(shared_->name, "Failed to start worker thread: {}", e.what());
        stop();
        throw;
    }

    LOG_DEBUG(shared_->name, "Started {} worker threads (queue limit {})",
              threads_.size(), maxQueued);
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->running) {
            return false;
        }
        if (shared_->maxQueued > 0 && shared_->tasks.size() >= shared_->maxQueued) {
            LOG_WARN(shared_->name, "Task queue full ({} waiting)", shared_->tasks.size());
            return false;
        }
        shared_->tasks.push_back(std::move(task));
    }
    shared_->cv.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->running = false;
    }
    shared_->cv.notify_all();

    for (auto& thread : threads_) {
        if (!thread.joinable()) {
            continue;
        }
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->tasks.size();
}

bool WorkerPool::isRunning() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->running;
}

void WorkerPool::workerLoop(std::shared_ptr<Shared> shared) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(shared->mutex);
            shared->cv.wait(lock, [&shared]() {
                return !shared->tasks.empty() || !shared->running;
            });
            // Queued tasks still run after stop()
            if (shared->tasks.empty()) {
                break;
            }
            task = std::move(shared->tasks.front());
            shared->tasks.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(shared->name, "Task failed: {}", e.what());
        }
    }
}

}  // namespace utils
}  // namespace ingestd
