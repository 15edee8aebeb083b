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
 * @file history.hpp
 * @brief Append-only audit trail of mutating operations.
 */

#pragma once

#include "proddb/infra/id_generator.hpp"
#include "proddb/storage/db.hpp"

#include <string>
#include <vector>

namespace proddb::core {

/// @brief Operation tags written to `history_entry.operation`.
namespace ops {
inline constexpr const char* kCreateDeviceType = "CREATE_DEVICE_TYPE";
inline constexpr const char* kCreateDevice = "CREATE_DEVICE";
inline constexpr const char* kCreateDeviceTypeAttribute = "CREATE_DEVICE_TYPE_ATTRIBUTE";
inline constexpr const char* kSetDeviceAttribute = "SET_DEVICE_ATTRIBUTE";
} // namespace ops

/**
 * @class HistoryRecorder
 * @brief Writes one immutable history row per mutating operation.
 *
 * @details
 * `record()` must be called inside the transaction of the operation it
 * describes, so the audit row commits or rolls back together with the change.
 * Storage failures propagate unchanged.
 */
class HistoryRecorder {
  public:
    HistoryRecorder(storage::Db& db, infra::IdGenerator& ids) : db_(db), ids_(ids) {}

    /**
     * @brief Appends a history entry stamped with the current UTC time.
     *
     * @param entity_id Identifier of the affected entity (not a foreign key).
     * @param operation One of the `ops::` tags.
     * @param comment Human-readable summary, e.g. `ACME/PN-100`.
     * @return std::string The id of the new history entry.
     */
    std::string record(const std::string& entity_id, const std::string& operation,
                       const std::string& comment);

    /// @brief All entries for an entity, oldest first.
    std::vector<storage::HistoryEntry> entries_for(const std::string& entity_id) const;

  private:
    storage::Db& db_;
    infra::IdGenerator& ids_;
};

} // namespace proddb::core
