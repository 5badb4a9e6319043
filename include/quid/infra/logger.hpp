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
 * @brief Thread-safe diagnostic logging facility for quid.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used
 * by the library and the `quid` command-line tool. Output is serialised under a
 * mutex so entries from concurrent generator calls never interleave.
 *
 * Being a library, quid stays quiet by default: only INFO and above are
 * emitted unless the host application lowers the threshold.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace quid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Byte-level detail (e.g., rejected input dumps).
    DEBUG, ///< Diagnostic information such as adapter decode rejections.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Non-blocking anomalies or potential misconfigurations.
    ERROR, ///< Failed operations, e.g. an unavailable random source.
    FATAL  ///< Failures that end the calling program.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * Messages below the current threshold are dropped before any locking.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @code
     * // Example Usage:
     * quid::infra::Logger::log(LogLevel::ERROR, "Generator: random source unavailable");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// Sets the minimum severity that will be emitted.
    static void set_level(LogLevel level);

    /// Returns the current minimum severity.
    static LogLevel level();

    /// True if a message at `level` would currently be emitted.
    static bool enabled(LogLevel level);

    /**
     * @brief Maps a level name (`trace`, `debug`, `info`, `warn`, `error`,
     * `fatal`, any case) to its `LogLevel`.
     * @return An empty optional for unknown names.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

  private:
    /// Guards `std::cout` / `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    static std::atomic<LogLevel> threshold_;
};

} // namespace quid::infra
