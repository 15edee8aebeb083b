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
 * @brief Thread-safe diagnostic logging facility for proddb.
 *
 * @details
 * Diagnostics are always written to `stderr`. The command surface owns `stdout`
 * for its JSON documents, so nothing in the logging path may touch it.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace proddb::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., individual statements).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (e.g., store opened, device created).
    WARN,  ///< Non-blocking anomalies or potential misconfigurations.
    ERROR, ///< Failed operations that were rolled back.
    FATAL  ///< Failures that terminate the process.
};

/**
 * @brief Parses a level name ("trace", "INFO", ...), case-insensitive.
 * @return The level, or `std::nullopt` for an unknown name.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * An internal mutex serializes writers so that lines from concurrent threads
 * never interleave. Messages below the configured threshold are dropped before
 * the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a timestamped, colour-tagged message to `stderr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * proddb::infra::Logger::log(LogLevel::INFO, "Store: Schema ready.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that is emitted (default: WARN).
    static void set_level(LogLevel level);

    /// @brief Returns the current threshold.
    static LogLevel level();

  private:
    /// @brief Guards `std::cerr` and `std::gmtime`'s static buffer.
    static std::mutex mutex_;

    static std::atomic<LogLevel> threshold_;
};

} // namespace proddb::infra
