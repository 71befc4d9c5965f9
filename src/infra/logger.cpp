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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formatting is `[YYYY-MM-DD HH:MM:SS] [TAG] message` with ANSI colour per
 * severity. The threshold check happens before the mutex is taken.
 */

#include "mintid/infra/logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mintid::infra {

namespace {

/// Sentinel meaning "not read from the environment yet".
constexpr int kUnset = -1;

} // namespace

std::mutex Logger::mutex_;
std::atomic<int> Logger::threshold_{kUnset};

LogLevel Logger::parse_level(std::string_view name, LogLevel fallback)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::TRACE;
    if (lower == "debug")
        return LogLevel::DEBUG;
    if (lower == "info")
        return LogLevel::INFO;
    if (lower == "warn" || lower == "warning")
        return LogLevel::WARN;
    if (lower == "error")
        return LogLevel::ERROR;
    if (lower == "fatal")
        return LogLevel::FATAL;
    return fallback;
}

LogLevel Logger::level()
{
    int current = threshold_.load(std::memory_order_relaxed);
    if (current == kUnset) {
        const char* env = std::getenv("MINTID_LOG_LEVEL");
        LogLevel seeded = env ? parse_level(env, LogLevel::INFO) : LogLevel::INFO;

        // A concurrent set_level() wins over the environment.
        int expected = kUnset;
        threshold_.compare_exchange_strong(expected, static_cast<int>(seeded),
                                           std::memory_order_relaxed);
        current = threshold_.load(std::memory_order_relaxed);
    }
    return static_cast<LogLevel>(current);
}

void Logger::set_level(LogLevel level)
{
    threshold_.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level)
{
    return level >= Logger::level();
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops messages under the threshold without locking.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` by severity.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex also protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

} // namespace mintid::infra
