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
 * @file records.hpp
 * @brief Plain row types mirroring the proddb relational schema.
 *
 * @details
 * Every `id` is a ULID issued by `infra::IdGenerator` and never changes after
 * insertion. Optional columns map to `std::optional<std::string>` and are
 * stored as SQL NULL when empty.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace proddb::storage {

/// @brief Catalog entry: a class of hardware identified by its part number.
struct DeviceType {
    std::string id;
    std::string part_number;
    std::string manufacturer_name;
    std::optional<std::string> model;
    std::optional<std::string> descriptor;
    std::optional<std::string> serial_number_spec;
};

/// @brief Attribute definition owned by a device type.
struct DeviceTypeAttribute {
    std::string id;
    std::string device_type;
    std::string attribute_name;
    std::string multiplicity;
};

/// @brief One physical unit. `part_number` is copied from the type at creation.
struct Device {
    std::string id;
    std::string device_type;
    std::string part_number;
    std::string serial_number;
};

/// @brief Attribute value owned by a device.
struct DeviceAttribute {
    std::string id;
    std::string device;
    std::string attribute_type;
    std::string attribute_name;
    std::optional<std::string> value;
};

/// @brief Immutable audit row. `entity_id` is not a foreign key; rows outlive their entity.
struct HistoryEntry {
    std::string id;
    std::string entity_id;
    std::string timestamp;
    std::string operation;
    std::string comment;
};

/// @brief Typed attribute value as exposed to callers.
struct AttributeValue {
    std::string id;
    std::string type;
    std::optional<std::string> value;
};

/// @brief Device joined with its type, as returned by queries.
struct DeviceView {
    std::string id;
    std::string device_type;
    std::string part_number;
    std::string serial_number;
    std::optional<std::string> model;
    std::string manufacturer_name;

    /// Attribute name -> value, ordered by name. Filled only by detail lookups.
    std::map<std::string, AttributeValue> attributes;
};

/**
 * @struct DeviceFilter
 * @brief Optional substring filters for device searches.
 *
 * Every present filter must match (logical AND). Matching is case-sensitive and
 * byte-exact. An absent or empty filter matches everything.
 */
struct DeviceFilter {
    std::optional<std::string> manufacturer;
    std::optional<std::string> part_number;
    std::optional<std::string> serial_number;
    std::optional<std::string> model;
};

/// @brief Device type together with its attribute definitions.
struct DeviceTypeView {
    DeviceType type;
    std::vector<DeviceTypeAttribute> attributes;
};

} // namespace proddb::storage
