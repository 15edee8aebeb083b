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
 * @file args.hpp
 * @brief Translates a command line into a request document.
 *
 * @details
 * The command line `proddb create-device --part-number PN-1 --next-serial --count 3`
 * becomes the request
 * `{"action": "create_device", "part_number": "PN-1", "next_serial": true, "count": 3}`,
 * the same document `Handler::process` accepts from any other source.
 *
 * Global options (`--db`, `--config`, `--log-level`, `--help`) may appear
 * anywhere on the line.
 */

#pragma once

#include "proddb/cli/json.hpp"

#include <optional>
#include <string>
#include <vector>

namespace proddb::cli {

/**
 * @struct Invocation
 * @brief Result of parsing one command line.
 */
struct Invocation {
    bool help = false;
    std::optional<std::string> config_file;
    std::optional<std::string> database_path;
    std::optional<std::string> log_level;

    /// Request document; null when `help` is set.
    ScopedJson request;
};

/**
 * @brief Parses the arguments following the program name.
 *
 * @throws infra::ValidationError (code `USAGE`) for unknown commands or flags,
 * missing flag values, missing required flags, non-numeric counts, or
 * `--serial` combined with `--next-serial`.
 */
Invocation parse_args(const std::vector<std::string>& args);

/// @brief Multi-line usage text.
std::string usage(const std::string& program);

} // namespace proddb::cli
