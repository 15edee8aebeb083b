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
 * @file time.hpp
 * @brief UTC timestamp formatting for audit records.
 */

#pragma once

#include <chrono>
#include <string>

namespace proddb::infra {

/**
 * @brief Formats a time point as ISO-8601 UTC with microseconds.
 *
 * Output shape: `2026-10-18T09:41:07.123456+00:00`. The fixed-width layout
 * makes the strings sort chronologically.
 */
std::string to_iso8601_utc(std::chrono::system_clock::time_point tp);

/// @brief `to_iso8601_utc(std::chrono::system_clock::now())`.
std::string now_iso8601_utc();

} // namespace proddb::infra
