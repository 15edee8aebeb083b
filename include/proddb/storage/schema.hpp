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
 * @file schema.hpp
 * @brief DDL for the proddb store.
 */

#pragma once

namespace proddb::storage {

/// @brief Idempotent schema script; safe to run against an existing file.
extern const char* const kSchema;

} // namespace proddb::storage
