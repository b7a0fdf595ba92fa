/*
 * QRLABEL LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 The qrlabel Authors.
 * See the LICENSE file at the repository root.
 *
 * This source code is licensed under the MIT License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.hpp
 * @brief Diagnostic logging facility for the label generator.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used
 * by every subsystem (store, generator, encoder, layout, pipeline). Messages
 * below the configured threshold are discarded before any formatting happens.
 */

#pragma once

#include <mutex>
#include <string>

namespace qrlabel::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * The ordering matters: filtering and stream routing compare levels.
 */
enum class LogLevel {
    TRACE, ///< Per-cell and per-row details.
    DEBUG, ///< Diagnostic information intended for development.
    INFO,  ///< Nominal run events (store loaded, page written).
    WARN,  ///< Recovered anomalies (skipped store rows, ignored options).
    ERROR, ///< Failures that end the current operation.
    FATAL  ///< Failures that end the process.
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
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
     *
     * Messages below the threshold set by `set_level` are dropped.
     *
     * @code
     * qrlabel::infra::Logger::log(LogLevel::INFO, "Store: Loaded 108 entries.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that will be written.
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Maps a case-insensitive level name to a `LogLevel`.
     *
     * Accepted names: `trace`, `debug`, `info`, `warn`, `error`, `fatal`.
     *
     * @throws ConfigurationError if the name is not recognized.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// @brief Serializes writes so lines from different sources never interleave.
    static std::mutex mutex_;

    /// @brief Minimum severity written; guarded by `mutex_`.
    static LogLevel threshold_;
};

} // namespace qrlabel::infra
