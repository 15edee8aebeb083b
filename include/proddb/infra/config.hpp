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
 * @file config.hpp
 * @brief Runtime configuration for the proddb executable.
 *
 * @details
 * Sources are layered; each later source overrides the earlier ones:
 * 1. Built-in defaults (`product.db`, `WARN`).
 * 2. JSON configuration file (`{"database": "...", "log_level": "..."}`).
 * 3. Environment (`PRODDB_DATABASE`, `PRODDB_LOG_LEVEL`).
 * 4. Command-line flags, applied by the CLI parser.
 */

#pragma once

#include "proddb/infra/logger.hpp"

#include <string>

namespace proddb::infra {

/**
 * @struct Config
 * @brief Resolved settings for one process run.
 */
struct Config {
    std::string database_path = "product.db";
    LogLevel log_level = LogLevel::WARN;

    /**
     * @brief Overlays values found in a JSON configuration file.
     *
     * Missing keys keep their current value.
     *
     * @throws ValidationError if the file cannot be read, is not a JSON object,
     * or names an unknown log level.
     */
    void apply_file(const std::string& path);

    /**
     * @brief Overlays `PRODDB_DATABASE` and `PRODDB_LOG_LEVEL` when set and non-empty.
     *
     * @throws ValidationError for an unknown log level name.
     */
    void apply_env();

    /// @brief Sets `log_level` from a name, throwing ValidationError if unknown.
    void set_log_level(const std::string& name);
};

} // namespace proddb::infra
