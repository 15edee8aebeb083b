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

#include "proddb/core/history.hpp"

#include "proddb/infra/logger.hpp"
#include "proddb/infra/time.hpp"

namespace proddb::core {

std::string HistoryRecorder::record(const std::string& entity_id, const std::string& operation,
                                    const std::string& comment)
{
    storage::HistoryEntry entry;
    entry.id = ids_.next_id();
    entry.entity_id = entity_id;
    entry.timestamp = infra::now_iso8601_utc();
    entry.operation = operation;
    entry.comment = comment;

    db_.insert_history(entry);

    infra::Logger::log(infra::LogLevel::TRACE,
                       "History: " + operation + " " + entity_id + " (" + comment + ")");
    return entry.id;
}

std::vector<storage::HistoryEntry> HistoryRecorder::entries_for(const std::string& entity_id) const
{
    return db_.history_for(entity_id);
}

} // namespace proddb::core
