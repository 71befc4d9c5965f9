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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (Logger, WorkerPool).
 */

#include "framework.hpp"
#include "mintid/infra/logger.hpp"
#include "mintid/infra/worker_pool.hpp"

#include <atomic>
#include <stdexcept>

using mintid::infra::Logger;
using mintid::infra::LogLevel;
using mintid::infra::WorkerPool;

/**
 * @brief Level names are case-insensitive; unknown names keep the fallback.
 */
void test_logger_parse_level()
{
    ASSERT_TRUE(Logger::parse_level("trace", LogLevel::INFO) == LogLevel::TRACE);
    ASSERT_TRUE(Logger::parse_level("DEBUG", LogLevel::INFO) == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level("Warning", LogLevel::INFO) == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("warn", LogLevel::INFO) == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("fatal", LogLevel::INFO) == LogLevel::FATAL);
    ASSERT_TRUE(Logger::parse_level("verbose", LogLevel::ERROR) == LogLevel::ERROR);
    ASSERT_TRUE(Logger::parse_level("", LogLevel::INFO) == LogLevel::INFO);
}

void test_logger_threshold()
{
    LogLevel saved = Logger::level();

    Logger::set_level(LogLevel::WARN);
    ASSERT_FALSE(Logger::enabled(LogLevel::DEBUG));
    ASSERT_FALSE(Logger::enabled(LogLevel::INFO));
    ASSERT_TRUE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::FATAL));

    Logger::set_level(LogLevel::TRACE);
    ASSERT_TRUE(Logger::enabled(LogLevel::TRACE));

    Logger::set_level(saved);
    ASSERT_TRUE(Logger::level() == saved);
}

/**
 * @brief Every submitted job runs before `wait_idle()` returns.
 */
void test_worker_pool_runs_all_jobs()
{
    std::atomic<int> done{0};
    WorkerPool pool(4);
    ASSERT_EQ(pool.size(), static_cast<size_t>(4));

    for (int i = 0; i < 500; ++i) {
        pool.enqueue([&done] { done.fetch_add(1); });
    }
    pool.wait_idle();
    ASSERT_EQ(done.load(), 500);

    // The pool stays usable after going idle.
    pool.enqueue([&done] { done.fetch_add(1); });
    pool.wait_idle();
    ASSERT_EQ(done.load(), 501);
}

void test_worker_pool_zero_threads_means_one()
{
    WorkerPool pool(0);
    ASSERT_EQ(pool.size(), static_cast<size_t>(1));
}

/**
 * @brief A throwing job is logged and its worker keeps serving the queue.
 */
void test_worker_pool_survives_throwing_job()
{
    LogLevel saved = Logger::level();
    Logger::set_level(LogLevel::FATAL);

    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        pool.enqueue([] { throw std::runtime_error("job failure"); });
        pool.enqueue([&done] { done.fetch_add(1); });
        pool.wait_idle();
    }
    ASSERT_EQ(done.load(), 1);

    Logger::set_level(saved);
}
