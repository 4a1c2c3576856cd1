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
 * @brief Implementation of the injectable diagnostic logger.
 *
 * @details
 * Formats each entry as `[YYYY-MM-DD HH:MM:SS] [TAG] message`, optionally with ANSI
 * color codes, and routes it to the informational or error stream by severity.
 */

#include "chronicle/infra/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace chronicle::infra {

namespace {

const char* tag_for(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "[TRCE] ";
    case LogLevel::DEBUG:
        return "[DBUG] ";
    case LogLevel::INFO:
        return "[INFO] ";
    case LogLevel::WARN:
        return "[WARN] ";
    case LogLevel::ERROR:
        return "[FAIL] ";
    case LogLevel::FATAL:
        return "[CRIT] ";
    }
    return "[????] ";
}

const char* color_for(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "\033[90m";
    case LogLevel::DEBUG:
        return "\033[36m";
    case LogLevel::INFO:
        return "\033[32m";
    case LogLevel::WARN:
        return "\033[33m";
    case LogLevel::ERROR:
        return "\033[31m";
    case LogLevel::FATAL:
        return "\033[1;31m";
    }
    return "";
}

} // namespace

Logger::Logger(LogLevel threshold) : Logger(std::cout, std::cerr, threshold, true) {}

Logger::Logger(std::ostream& out, std::ostream& err, LogLevel threshold, bool colored)
    : out_(out), err_(err), colored_(colored), threshold_(threshold)
{
}

void Logger::set_threshold(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::threshold() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::enabled(LogLevel level) const
{
    return level >= threshold();
}

/**
 * @brief Dispatches a formatted log entry to the appropriate stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops the entry when below the configured threshold.
 * 2. **Chronometry**: Captures the current system clock and formats it.
 * 3. **Stream Segregation**: Routes `WARN` and above to the error stream.
 * 4. **Stylization**: Injects ANSI escape sequences when enabled.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_)
        return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? err_ : out_;

    // Mutex also protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    if (colored_)
        stream << color_for(level);
    stream << tag_for(level) << message;
    if (colored_)
        stream << "\033[0m";
    stream << std::endl;
}

LogLevel Logger::parse_level(const std::string& name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")
        return LogLevel::TRACE;
    if (lowered == "debug")
        return LogLevel::DEBUG;
    if (lowered == "info")
        return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::WARN;
    if (lowered == "error")
        return LogLevel::ERROR;
    if (lowered == "fatal")
        return LogLevel::FATAL;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace chronicle::infra
