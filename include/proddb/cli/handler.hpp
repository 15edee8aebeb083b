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
 * @file handler.hpp
 * @brief Request dispatcher between the command line and the inventory service.
 *
 * @details
 * A request is a JSON object with an `"action"` member plus action-specific
 * arguments. The handler decodes it, invokes `core::InventoryService`, and
 * serializes the result (or the failure) into a response document:
 *
 * - **Success:** `{"status": "ok", ...action-specific members...}`
 * - **Error:** `{"status": "error", "error": {"kind": "CONFLICT", "code": "DUPLICATE_SERIAL", "message": "..."}}`
 */

#pragma once

#include "proddb/core/inventory.hpp"
#include "proddb/infra/error.hpp"

#include <cJSON.h>
#include <string>

namespace proddb::cli {

/// Process exit statuses.
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2; ///< Bad arguments or an unparseable request.

/// @brief A serialized response together with its outcome.
struct Reply {
    bool ok = false;
    infra::ErrorKind kind = infra::ErrorKind::INTERNAL; ///< Meaningful only when `ok` is false.
    std::string code;                                    ///< Error code; empty on success.
    std::string document;
};

/**
 * @class Handler
 * @brief Stateless controller mapping request documents onto service calls.
 */
class Handler {
  public:
    /**
     * @brief Executes one decoded request.
     *
     * Never throws for domain failures: every `infra::Error` raised by the
     * service is converted into an error document.
     *
     * @code
     * {"action": "create_device", "part_number": "PN-1", "next_serial": true, "count": 3}
     * @endcode
     */
    static Reply process(core::InventoryService& service, const cJSON* request);

    /// @brief Parses `raw_json` first; malformed input yields a `VALIDATION` error reply.
    static Reply process(core::InventoryService& service, const std::string& raw_json);

    /// @brief Builds the error document for `err`.
    static Reply failure(const infra::Error& err);
};

/**
 * @brief Maps a reply onto the process exit status.
 *
 * Success is `kExitOk`; a `USAGE` error is `kExitUsage`; every other error is
 * `kExitError`.
 */
int exit_status(const Reply& reply);

} // namespace proddb::cli
