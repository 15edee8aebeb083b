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
 */

#include "proddb/infra/logger.hpp"

#include "proddb/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace proddb::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::WARN};

std::optional<LogLevel> parse_log_level(const std::string& name)
{
    std::string n = String::to_upper(String::trim(name));
    if (n == "TRACE")
        return LogLevel::TRACE;
    if (n == "DEBUG")
        return LogLevel::DEBUG;
    if (n == "INFO")
        return LogLevel::INFO;
    if (n == "WARN" || n == "WARNING")
        return LogLevel::WARN;
    if (n == "ERROR")
        return LogLevel::ERROR;
    if (n == "FATAL")
        return LogLevel::FATAL;
    return std::nullopt;
}

void Logger::set_level(LogLevel level)
{
    threshold_.store(level);
}

LogLevel Logger::level()
{
    return threshold_.load();
}

/**
 * @brief Dispatches a formatted log entry to `stderr`.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops messages below the threshold without locking.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Chronometry**: Formats the current time as UTC.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (level < threshold_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = std::cerr;

    // Formatting: [YYYY-MM-DDTHH:MM:SSZ]
    stream << "[" << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ") << "] ";

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

} // namespace proddb::infra
