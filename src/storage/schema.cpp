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

#include "proddb/storage/schema.hpp"

namespace proddb::storage {

// Attribute rows cascade with their owner. A device type that still has devices
// cannot be deleted. history_entry.entity_ulid has no REFERENCES clause so audit
// rows outlive the entities they describe.
const char* const kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS device_type (
    ulid               TEXT PRIMARY KEY,
    part_number        TEXT NOT NULL UNIQUE,
    manufacturer_name  TEXT NOT NULL,
    model              TEXT,
    descriptor         TEXT,
    serial_number_spec TEXT
);

CREATE TABLE IF NOT EXISTS device_type_attribute (
    ulid           TEXT PRIMARY KEY,
    device_type    TEXT NOT NULL,
    attribute_name TEXT NOT NULL,
    multiplicity   TEXT NOT NULL,
    FOREIGN KEY(device_type) REFERENCES device_type(ulid) ON DELETE CASCADE,
    UNIQUE(device_type, attribute_name)
);

CREATE TABLE IF NOT EXISTS device (
    ulid          TEXT PRIMARY KEY,
    device_type   TEXT NOT NULL,
    part_number   TEXT NOT NULL,
    serial_number TEXT NOT NULL UNIQUE,
    FOREIGN KEY(device_type) REFERENCES device_type(ulid)
);

CREATE TABLE IF NOT EXISTS device_attribute (
    ulid           TEXT PRIMARY KEY,
    device         TEXT NOT NULL,
    attribute_type TEXT NOT NULL,
    attribute_name TEXT NOT NULL,
    value          TEXT,
    FOREIGN KEY(device) REFERENCES device(ulid) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS history_entry (
    ulid        TEXT PRIMARY KEY,
    entity_ulid TEXT NOT NULL,
    timestamp   TEXT NOT NULL,
    operation   TEXT,
    comment     TEXT
);

CREATE INDEX IF NOT EXISTS idx_device_device_type ON device(device_type);
CREATE INDEX IF NOT EXISTS idx_device_attribute_device ON device_attribute(device);
CREATE INDEX IF NOT EXISTS idx_history_entity ON history_entry(entity_ulid);
)SQL";

} // namespace proddb::storage
