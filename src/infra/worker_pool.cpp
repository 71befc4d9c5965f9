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
 * @file worker_pool.cpp
 * @brief Implementation of the fixed-size worker pool.
 */

#include "mintid/infra/worker_pool.hpp"

#include "mintid/infra/logger.hpp"

#include <exception>
#include <string>

namespace mintid::infra {

WorkerPool::WorkerPool(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

/**
 * @brief Worker event loop.
 *
 * Sleeps until a job arrives, runs it outside the lock, then signals
 * `idle_` if it was the last job in flight.
 */
void WorkerPool::worker_loop()
{
    while (true) {
        std::function<void()> job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !jobs_.empty(); });

            // Exit only once stopping AND drained, so submitted work always runs.
            if (stop_ && jobs_.empty()) {
                return;
            }

            job = std::move(jobs_.front());
            jobs_.pop();
            ++active_;
        }

        if (job) {
            try {
                job();
            } catch (const std::exception& e) {
                Logger::log(LogLevel::ERROR,
                            "WorkerPool: job terminated with exception: " + std::string(e.what()));
            }
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_;
            if (active_ == 0 && jobs_.empty()) {
                idle_.notify_all();
            }
        }
    }
}

WorkerPool::~WorkerPool()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::enqueue(std::function<void()> job)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        jobs_.emplace(std::move(job));
    }
    condition_.notify_one();
}

void WorkerPool::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] { return jobs_.empty() && active_ == 0; });
}

} // namespace mintid::infra
