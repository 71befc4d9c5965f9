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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for mintid.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel of the
 * library and the command line tool. Output to `stdout`/`stderr` is serialised
 * by a mutex so lines written by concurrent generator threads never interleave.
 * Messages below the configured threshold are discarded before the lock is
 * taken, which keeps TRACE calls on the refill path cheap in production.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

namespace mintid::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages, lowest first.
 */
enum class LogLevel {
    TRACE, ///< Per-refill and per-retry details.
    DEBUG, ///< Diagnostic information for development.
    INFO,  ///< Nominal operational events (generator construction, CLI status).
    WARN,  ///< Non-blocking anomalies.
    ERROR, ///< A call failed (e.g. the entropy source refused to deliver).
    FATAL  ///< The executable is about to terminate.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * **Threshold configuration:**
 * On first use the threshold is read from the `MINTID_LOG_LEVEL` environment
 * variable (`trace`, `debug`, `info`, `warn`, `error`, `fatal`, case
 * insensitive). Unset or unrecognised values select `INFO`. `set_level()`
 * overrides it at any time.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * mintid::infra::Logger::log(LogLevel::INFO, "Generator: 8 shards online.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Replaces the minimum severity that reaches the console.
    static void set_level(LogLevel level);

    /// @brief The current minimum severity.
    static LogLevel level();

    /// @brief True when a message of `level` would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Maps a level name to its enumerator.
     *
     * @param name One of `trace|debug|info|warn|error|fatal`, any case.
     * @param fallback Returned for an unrecognised name.
     */
    static LogLevel parse_level(std::string_view name, LogLevel fallback);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved lines.
    static std::mutex mutex_;

    /// @brief Minimum severity, lazily seeded from the environment.
    static std::atomic<int> threshold_;
};

} // namespace mintid::infra
