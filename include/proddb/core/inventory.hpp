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
 * @file inventory.hpp
 * @brief Transactional orchestration of device-type and device operations.
 *
 * @details
 * `InventoryService` is the single entry point used by the command surface.
 * Each mutating operation is exactly one `storage::Transaction`: validation,
 * serial allocation, inserts and history rows either all commit or all roll
 * back. Read operations run outside any transaction.
 */

#pragma once

#include "proddb/core/history.hpp"
#include "proddb/core/serial_allocator.hpp"
#include "proddb/infra/id_generator.hpp"
#include "proddb/storage/db.hpp"
#include "proddb/storage/records.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace proddb::core {

/// @brief Input for registering a device type.
struct DeviceTypeSpec {
    std::string part_number;
    std::string manufacturer_name;
    std::optional<std::string> model;
    std::optional<std::string> descriptor;
    std::optional<std::string> serial_number_spec;
};

/**
 * @class SerialSource
 * @brief Either a caller-supplied serial or a request to allocate the next one.
 */
class SerialSource {
  public:
    static SerialSource explicit_serial(std::string serial)
    {
        return SerialSource(false, std::move(serial));
    }

    static SerialSource next() { return SerialSource(true, ""); }

    bool is_auto() const { return auto_; }
    const std::string& serial() const { return serial_; }

  private:
    SerialSource(bool is_auto, std::string serial) : auto_(is_auto), serial_(std::move(serial)) {}

    bool auto_;
    std::string serial_;
};

/// @brief One device produced by `create_devices`.
struct CreatedDevice {
    std::string device_id;
    std::string serial;
};

/**
 * @class InventoryService
 * @brief Registers device types and allocates devices atomically.
 */
class InventoryService {
  public:
    InventoryService(storage::Db& db, infra::IdGenerator& ids);

    /**
     * @brief Registers a new device type.
     *
     * @return std::string The id of the new device type.
     *
     * @throws infra::ValidationError blank part number / manufacturer
     * (`MISSING_FIELD`), or a serial spec that does not parse (`MALFORMED_SPEC`).
     * @throws infra::ConflictError `DUPLICATE_PART_NUMBER`.
     */
    std::string register_device_type(const DeviceTypeSpec& spec);

    /**
     * @brief Creates `count` devices of the type identified by `part_number`.
     *
     * With `SerialSource::next()` each device receives the next serial, computed
     * afresh per iteration, so a batch gets consecutive numbers. An explicit
     * serial is only valid for a single device.
     *
     * @return The created devices in creation order.
     *
     * @throws infra::ValidationError `INVALID_COUNT`, `MISSING_FIELD`, `MALFORMED_SPEC`.
     * @throws infra::ConflictError `AMBIGUOUS_SERIAL`, `DUPLICATE_SERIAL`.
     * @throws infra::NotFoundError `UNKNOWN_DEVICE_TYPE`.
     */
    std::vector<CreatedDevice> create_devices(const std::string& part_number, int64_t count,
                                              const SerialSource& source);

    /// @brief Devices joined with their types, filtered by case-sensitive substrings.
    std::vector<storage::DeviceView> find_devices(const storage::DeviceFilter& filter) const;

    /**
     * @brief Declares an attribute on a device type.
     *
     * @throws infra::NotFoundError `UNKNOWN_DEVICE_TYPE`.
     * @throws infra::ConflictError `DUPLICATE_ATTRIBUTE`.
     */
    std::string add_device_type_attribute(const std::string& part_number,
                                          const std::string& attribute_name,
                                          const std::string& multiplicity);

    /**
     * @brief Attaches a typed attribute value to a device.
     *
     * @throws infra::NotFoundError `UNKNOWN_DEVICE`.
     * @throws infra::ConflictError `DUPLICATE_ATTRIBUTE` if the device already
     * carries an attribute with that name.
     */
    std::string add_device_attribute(const std::string& device_id,
                                     const std::string& attribute_type,
                                     const std::string& attribute_name,
                                     const std::optional<std::string>& value);

    /**
     * @brief Full view of one device including its attributes.
     * @throws infra::NotFoundError `UNKNOWN_DEVICE`.
     */
    storage::DeviceView get_device(const std::string& device_id) const;

    std::vector<storage::DeviceTypeView> list_device_types() const;

    /// @brief Audit trail of one entity, oldest first.
    std::vector<storage::HistoryEntry> history(const std::string& entity_id) const;

  private:
    template <typename Fn> auto atomically(const char* operation, Fn&& fn);

    storage::Db& db_;
    infra::IdGenerator& ids_;
    SerialAllocator serials_;
    HistoryRecorder history_;
};

} // namespace proddb::core
