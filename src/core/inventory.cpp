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
 * @file inventory.cpp
 * @brief Implementation of the inventory service.
 *
 * @details
 * Every mutating operation follows the same sequence:
 * 1. **Validate** arguments that need no store access.
 * 2. **Begin** an immediate transaction (exclusive writer).
 * 3. **Act**: lookups, allocation, inserts, history rows.
 * 4. **Commit**, or roll back and rethrow on the first failure.
 */

#include "proddb/core/inventory.hpp"

#include "proddb/infra/error.hpp"
#include "proddb/infra/logger.hpp"
#include "proddb/infra/string.hpp"
#include "proddb/storage/transaction.hpp"

namespace proddb::core {

namespace {

void require_field(const std::string& value, const char* name)
{
    if (infra::String::is_blank(value)) {
        throw infra::ValidationError("MISSING_FIELD", std::string(name) + " must not be empty");
    }
}

/// Empty optional strings are stored as NULL.
std::optional<std::string> normalize(const std::optional<std::string>& value)
{
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

InventoryService::InventoryService(storage::Db& db, infra::IdGenerator& ids)
    : db_(db), ids_(ids), serials_(db), history_(db, ids)
{
}

template <typename Fn> auto InventoryService::atomically(const char* operation, Fn&& fn)
{
    storage::Transaction tx(db_);
    try {
        auto result = fn();
        tx.commit();
        return result;
    } catch (const infra::Error& e) {
        if (tx.active()) {
            tx.abort();
        }
        infra::Logger::log(infra::LogLevel::ERROR, std::string("Inventory: ") + operation +
                                                       " rolled back: " + e.what());
        throw;
    }
}

// ============================================================================
//  Device types
// ============================================================================

std::string InventoryService::register_device_type(const DeviceTypeSpec& spec)
{
    require_field(spec.part_number, "part_number");
    require_field(spec.manufacturer_name, "manufacturer_name");

    auto serial_spec = normalize(spec.serial_number_spec);
    if (serial_spec) {
        SerialSpec::parse(*serial_spec);
    }

    std::string id = atomically("register_device_type", [&] {
        if (db_.device_type_by_part(spec.part_number)) {
            throw infra::ConflictError("DUPLICATE_PART_NUMBER",
                                       "Part number '" + spec.part_number + "' already exists");
        }

        storage::DeviceType row;
        row.id = ids_.next_id();
        row.part_number = spec.part_number;
        row.manufacturer_name = spec.manufacturer_name;
        row.model = normalize(spec.model);
        row.descriptor = normalize(spec.descriptor);
        row.serial_number_spec = serial_spec;

        db_.insert_device_type(row);
        history_.record(row.id, ops::kCreateDeviceType,
                        row.manufacturer_name + "/" + row.part_number);
        return row.id;
    });

    infra::Logger::log(infra::LogLevel::INFO, "Inventory: Registered device type " +
                                                  spec.part_number + " as " + id);
    return id;
}

std::string InventoryService::add_device_type_attribute(const std::string& part_number,
                                                        const std::string& attribute_name,
                                                        const std::string& multiplicity)
{
    require_field(part_number, "part_number");
    require_field(attribute_name, "attribute_name");
    require_field(multiplicity, "multiplicity");

    return atomically("add_device_type_attribute", [&] {
        auto type = db_.device_type_by_part(part_number);
        if (!type) {
            throw infra::NotFoundError("UNKNOWN_DEVICE_TYPE",
                                       "Unknown part number '" + part_number + "'");
        }
        if (db_.device_type_attribute_exists(type->id, attribute_name)) {
            throw infra::ConflictError("DUPLICATE_ATTRIBUTE", "Attribute '" + attribute_name +
                                                                  "' already defined for " +
                                                                  part_number);
        }

        storage::DeviceTypeAttribute row{ids_.next_id(), type->id, attribute_name, multiplicity};
        db_.insert_device_type_attribute(row);
        history_.record(type->id, ops::kCreateDeviceTypeAttribute,
                        part_number + "/" + attribute_name);
        return row.id;
    });
}

std::vector<storage::DeviceTypeView> InventoryService::list_device_types() const
{
    std::vector<storage::DeviceTypeView> views;
    for (auto& type : db_.device_types()) {
        auto attributes = db_.device_type_attributes(type.id);
        views.push_back({std::move(type), std::move(attributes)});
    }
    return views;
}

// ============================================================================
//  Devices
// ============================================================================

std::vector<CreatedDevice> InventoryService::create_devices(const std::string& part_number,
                                                            int64_t count,
                                                            const SerialSource& source)
{
    require_field(part_number, "part_number");
    if (count < 1) {
        throw infra::ValidationError("INVALID_COUNT",
                                     "count must be at least 1, got " + std::to_string(count));
    }
    if (!source.is_auto()) {
        require_field(source.serial(), "serial");
        if (count > 1) {
            throw infra::ConflictError("AMBIGUOUS_SERIAL",
                                       "An explicit serial cannot be used with count " +
                                           std::to_string(count));
        }
    }

    auto created = atomically("create_devices", [&] {
        auto type = db_.device_type_by_part(part_number);
        if (!type) {
            throw infra::NotFoundError("UNKNOWN_DEVICE_TYPE",
                                       "Unknown part number '" + part_number + "'");
        }

        std::vector<CreatedDevice> out;
        out.reserve(static_cast<size_t>(count));

        for (int64_t i = 0; i < count; ++i) {
            std::string serial = source.is_auto() ? serials_.allocate_next(*type) : source.serial();

            if (db_.serial_exists(serial)) {
                throw infra::ConflictError("DUPLICATE_SERIAL",
                                           "Serial '" + serial + "' is already in use");
            }

            storage::Device row{ids_.next_id(), type->id, type->part_number, serial};
            db_.insert_device(row);
            history_.record(row.id, ops::kCreateDevice, row.part_number + "/" + serial);
            out.push_back({row.id, serial});
        }
        return out;
    });

    infra::Logger::log(infra::LogLevel::INFO, "Inventory: Created " +
                                                  std::to_string(created.size()) +
                                                  " device(s) of " + part_number);
    return created;
}

std::string InventoryService::add_device_attribute(const std::string& device_id,
                                                   const std::string& attribute_type,
                                                   const std::string& attribute_name,
                                                   const std::optional<std::string>& value)
{
    require_field(device_id, "device");
    require_field(attribute_type, "attribute_type");
    require_field(attribute_name, "attribute_name");

    return atomically("add_device_attribute", [&] {
        auto device = db_.device_by_id(device_id);
        if (!device) {
            throw infra::NotFoundError("UNKNOWN_DEVICE", "Unknown device '" + device_id + "'");
        }
        for (const auto& existing : db_.device_attributes(device_id)) {
            if (existing.attribute_name == attribute_name) {
                throw infra::ConflictError("DUPLICATE_ATTRIBUTE",
                                           "Device " + device_id + " already has attribute '" +
                                               attribute_name + "'");
            }
        }

        storage::DeviceAttribute row{ids_.next_id(), device_id, attribute_type, attribute_name,
                                     value};
        db_.insert_device_attribute(row);
        history_.record(device_id, ops::kSetDeviceAttribute,
                        device->serial_number + "/" + attribute_name);
        return row.id;
    });
}

std::vector<storage::DeviceView>
InventoryService::find_devices(const storage::DeviceFilter& filter) const
{
    return db_.find_devices(filter);
}

storage::DeviceView InventoryService::get_device(const std::string& device_id) const
{
    auto device = db_.device_by_id(device_id);
    if (!device) {
        throw infra::NotFoundError("UNKNOWN_DEVICE", "Unknown device '" + device_id + "'");
    }
    auto type = db_.device_type_by_id(device->device_type);
    if (!type) {
        throw infra::NotFoundError("UNKNOWN_DEVICE_TYPE",
                                   "Device type '" + device->device_type + "' vanished");
    }

    storage::DeviceView view;
    view.id = device->id;
    view.device_type = device->device_type;
    view.part_number = device->part_number;
    view.serial_number = device->serial_number;
    view.model = type->model;
    view.manufacturer_name = type->manufacturer_name;
    for (auto& attr : db_.device_attributes(device_id)) {
        view.attributes[attr.attribute_name] = {attr.id, attr.attribute_type, attr.value};
    }
    return view;
}

std::vector<storage::HistoryEntry> InventoryService::history(const std::string& entity_id) const
{
    require_field(entity_id, "entity");
    return history_.entries_for(entity_id);
}

} // namespace proddb::core
