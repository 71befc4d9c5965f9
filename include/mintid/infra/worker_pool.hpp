/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool used to drive concurrent generation.
 *
 * @details
 * This header defines `WorkerPool`, a producer-consumer pool of long-lived
 * threads. The benchmark mode of the `mintid` tool and the concurrency tests
 * use it to hammer one `Generator` from many threads at once, then block on
 * `wait_idle()` until every submitted job has finished.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mintid::infra {

/**
 * @class WorkerPool
 * @brief A thread-safe worker pool for executing jobs asynchronously.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a job.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Barrier:** `wait_idle()` returns once the queue is empty and no job is running.
 */
class WorkerPool {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero is replaced by one.
     */
    explicit WorkerPool(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the queue, then joins every worker.
     *
     * @note Blocking: pending jobs still run before the pool is destroyed.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Submits a job for asynchronous execution.
     *
     * Jobs must not throw; an escaping exception is logged and discarded so the
     * worker survives.
     */
    void enqueue(std::function<void()> job);

    /// @brief Blocks until every submitted job has completed.
    void wait_idle();

    /// @brief Number of worker threads.
    size_t size() const
    {
        return workers_.size();
    }

  private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;

    /// @brief Protects `jobs_` and `active_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers on new jobs or shutdown.
    std::condition_variable condition_;

    /// @brief Wakes `wait_idle()` callers when the pool drains.
    std::condition_variable idle_;

    /// @brief Jobs dequeued but not yet finished.
    size_t active_ = 0;

    std::atomic<bool> stop_;
};

} // namespace mintid::infra
