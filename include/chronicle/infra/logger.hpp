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
 * @brief Thread-safe diagnostic logging sink shared by the store and the versioning engine.
 *
 * @details
 * This header declares the `Logger` class. A single instance is created by the
 * embedding application (or a test) and handed to every component that reports
 * diagnostics: the document store, the chain walkers, the versioned collections and
 * the command shell. There is no process-wide logger; components log through the
 * instance they were constructed with.
 */

#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace chronicle::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Messages below the logger's threshold are discarded. Messages at `WARN` and above
 * are routed to the error stream.
 */
enum class LogLevel {
    TRACE, ///< Per-operation details (individual reads, chain hops).
    DEBUG, ///< Diagnostic information (transaction retries, journal replay).
    INFO,  ///< Nominal operational events (startup, declarations, compaction).
    WARN,  ///< Non-blocking anomalies (dangling chain links, skipped removals).
    ERROR, ///< Recoverable runtime errors (corrupt journal frames, failed commands).
    FATAL  ///< Critical failures that terminate the process.
};

/**
 * @class Logger
 * @brief An injectable, thread-safe writer of formatted diagnostic lines.
 *
 * @details
 * Each line carries a wall-clock timestamp, a severity tag and the payload. An internal
 * mutex serializes writers so that lines from concurrent transactions never interleave.
 * Output streams are injectable, which lets tests capture and inspect warnings.
 */
class Logger {
  public:
    /**
     * @brief Creates a logger writing to `std::cout` / `std::cerr`.
     *
     * @param threshold Minimum severity that is emitted.
     */
    explicit Logger(LogLevel threshold = LogLevel::INFO);

    /**
     * @brief Creates a logger writing to caller-owned streams.
     *
     * @param out Stream receiving `TRACE`, `DEBUG` and `INFO` lines.
     * @param err Stream receiving `WARN`, `ERROR` and `FATAL` lines.
     * @param threshold Minimum severity that is emitted.
     * @param colored Whether to wrap severity tags in ANSI escape sequences.
     *
     * @warning Both streams must outlive the logger.
     */
    Logger(std::ostream& out, std::ostream& err, LogLevel threshold, bool colored);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Writes a formatted diagnostic line if `level` passes the threshold.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * logger->log(LogLevel::WARN, "Chain: dangling previous_delta 65f1c0...");
     * @endcode
     */
    void log(LogLevel level, const std::string& message);

    /// @brief Changes the minimum emitted severity.
    void set_threshold(LogLevel level);

    /// @brief Returns the minimum emitted severity.
    LogLevel threshold() const;

    /// @brief Returns true when a message of `level` would be written.
    bool enabled(LogLevel level) const;

    /**
     * @brief Parses a severity name as accepted on the command line.
     *
     * Accepts `trace`, `debug`, `info`, `warn`, `error` and `fatal` (case-insensitive).
     *
     * @throws std::invalid_argument For any other input.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    std::ostream& out_;
    std::ostream& err_;
    bool colored_;

    /// @brief Guards the threshold and both streams.
    mutable std::mutex mutex_;
    LogLevel threshold_;
};

} // namespace chronicle::infra
